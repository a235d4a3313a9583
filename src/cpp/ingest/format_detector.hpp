#pragma once
// Maps a file name to the extraction path it takes (extension only)
#include <string>
#include <vector>

namespace stmt {

enum class FileKind { CSV, EXCEL, JSON, TEXT, PDF, UNKNOWN };

inline const char* file_kind_str(FileKind k) {
    switch (k) {
        case FileKind::CSV:     return "csv";
        case FileKind::EXCEL:   return "excel";
        case FileKind::JSON:    return "json";
        case FileKind::TEXT:    return "text";
        case FileKind::PDF:     return "pdf";
        case FileKind::UNKNOWN: return "unknown";
    }
    return "??";
}

FileKind detect_file_kind(const std::string& filename);

// Lower-cased extension without the dot ("" when there is none)
std::string file_extension(const std::string& filename);

// OLE2 compound document signature (D0 CF 11 E0). Encrypted .xlsx files are
// wrapped in one; plain .xlsx files are zip archives.
bool has_ole2_signature(const std::vector<char>& bytes);

bool has_pdf_signature(const std::vector<char>& bytes);

} // namespace stmt
