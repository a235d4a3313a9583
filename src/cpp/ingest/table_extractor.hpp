#pragma once
// =============================================================================
// Table Extractor: file content -> RawRows
//
//   - delimited text (CSV/TSV, .txt, pdftotext output), delimiter sniffed
//   - spreadsheet grids, with repair of banner rows above the real header
//   - JSON arrays or {"transactions": [...]}
//
// Empty input yields no rows; deciding whether that is an error is left to
// the caller.
// =============================================================================

#include <string>
#include <vector>

#include "raw_row.hpp"

namespace stmt {

// Sheet content as rows of cell text (first sheet only)
using Grid = std::vector<std::vector<std::string>>;

// Words that mark a header cell
const std::vector<std::string>& header_keywords();

bool contains_header_keyword(const std::string& cell);

// Candidate delimiters in priority order: ',', '\t', '|', ';'
char sniff_delimiter(const std::string& first_line);

// Quote-aware split. "" inside quotes is a literal quote; quoted fields may
// contain the delimiter and newlines.
Grid parse_delimited(const std::string& text, char delim);

std::vector<RawRow> extract_delimited(const std::string& text);

// Header-row conversion as sheet readers do it: synthetic __EMPTY keys for
// blank header cells, _N suffixes for repeated names, "" for missing cells,
// blank rows dropped.
std::vector<RawRow> rows_from_grid(const Grid& grid);

// Finds the real header when the first sheet row is a title banner
std::vector<RawRow> repair_headers(std::vector<RawRow> rows);

std::vector<RawRow> extract_grid(const Grid& grid);

// Throws FormatError on malformed JSON or when no entry is an object
std::vector<RawRow> extract_json(const std::string& text);

} // namespace stmt
