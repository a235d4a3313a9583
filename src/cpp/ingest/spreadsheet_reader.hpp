#pragma once
// Byte-level document decoding is delegated to external converters:
//   .xlsx/.xlsm -> xlsx2csv, .xls -> xls2csv, .pdf -> pdftotext -layout
// The interfaces let tests feed grids and text without the tools installed.
#include <string>
#include <utility>
#include <vector>

#include "../config.hpp"
#include "table_extractor.hpp"

namespace stmt {

class SpreadsheetReader {
public:
    virtual ~SpreadsheetReader() = default;

    // First sheet of the workbook. extension is "xlsx", "xlsm" or "xls".
    virtual Grid read_first_sheet(const std::vector<char>& bytes, const std::string& extension) = 0;
};

class PdfTextReader {
public:
    virtual ~PdfTextReader() = default;

    virtual std::string read_text(const std::vector<char>& bytes) = 0;
};

class ConverterSpreadsheetReader : public SpreadsheetReader {
public:
    explicit ConverterSpreadsheetReader(ToolPaths tools) : tools_(std::move(tools)) {}

    Grid read_first_sheet(const std::vector<char>& bytes, const std::string& extension) override;

private:
    ToolPaths tools_;
};

class PdftotextReader : public PdfTextReader {
public:
    explicit PdftotextReader(std::string tool) : tool_(std::move(tool)) {}

    std::string read_text(const std::vector<char>& bytes) override;

private:
    std::string tool_;
};

// Runs tool on the bytes (written to a scratch file) and returns its stdout.
// Throws FormatError when the tool is missing or exits non-zero.
std::string run_converter(const std::string& tool,
                          const std::vector<std::string>& leading_args,
                          const std::vector<std::string>& trailing_args,
                          const std::vector<char>& bytes,
                          const std::string& suffix);

} // namespace stmt
