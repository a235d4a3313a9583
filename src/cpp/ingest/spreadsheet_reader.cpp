#include "spreadsheet_reader.hpp"
#include "../errors.hpp"
#include "../utils/logger.hpp"
#include "../utils/process.hpp"

namespace stmt {

std::string run_converter(const std::string& tool,
                          const std::vector<std::string>& leading_args,
                          const std::vector<std::string>& trailing_args,
                          const std::vector<char>& bytes,
                          const std::string& suffix) {
    const std::string exe = find_executable(tool);
    if (exe.empty()) {
        throw FormatError("Reading " + suffix + " files requires " + tool + " on PATH");
    }

    TempFile input(suffix);
    input.write(bytes);
    TempFile output(".out");

    std::vector<std::string> args = leading_args;
    args.push_back(input.path());
    args.insert(args.end(), trailing_args.begin(), trailing_args.end());

    const int rc = spawn_to_file(exe, args, output.path());
    if (rc != 0) {
        LOG_ERR("[convert] %s exited with code %d", exe.c_str(), rc);
        throw FormatError("Failed to convert " + suffix + " file with " + tool);
    }
    return output.read();
}

Grid ConverterSpreadsheetReader::read_first_sheet(const std::vector<char>& bytes,
                                                  const std::string& extension) {
    std::string csv;
    if (extension == "xls") {
        csv = run_converter(tools_.xls2csv, {}, {}, bytes, ".xls");
        // sheets are separated by form feeds
        auto ff = csv.find('\f');
        if (ff != std::string::npos) csv.resize(ff);
    } else {
        // sheet 1 only
        csv = run_converter(tools_.xlsx2csv, {"-s", "1"}, {}, bytes, "." + extension);
    }

    Grid grid = parse_delimited(csv, ',');
    LOG_DBG("[convert] %s sheet: %zu grid rows", extension.c_str(), grid.size());
    return grid;
}

std::string PdftotextReader::read_text(const std::vector<char>& bytes) {
    std::string out = run_converter(tool_, {"-layout"}, {"-"}, bytes, ".pdf");
    LOG_DBG("[convert] pdftotext produced %zu bytes", out.size());
    return out;
}

} // namespace stmt
