#include "format_detector.hpp"
#include "../utils/text.hpp"

namespace stmt {

std::string file_extension(const std::string& filename) {
    auto slash = filename.find_last_of("/\\");
    auto dot = filename.find_last_of('.');
    if (dot == std::string::npos) return "";
    if (slash != std::string::npos && dot < slash) return "";
    return text::to_lower(filename.substr(dot + 1));
}

FileKind detect_file_kind(const std::string& filename) {
    const std::string ext = file_extension(filename);
    if (ext == "csv" || ext == "tsv") return FileKind::CSV;
    if (ext == "xls" || ext == "xlsx" || ext == "xlsm") return FileKind::EXCEL;
    if (ext == "json") return FileKind::JSON;
    if (ext == "txt") return FileKind::TEXT;
    if (ext == "pdf") return FileKind::PDF;
    return FileKind::UNKNOWN;
}

bool has_ole2_signature(const std::vector<char>& bytes) {
    static const unsigned char magic[4] = {0xD0, 0xCF, 0x11, 0xE0};
    if (bytes.size() < 4) return false;
    for (size_t i = 0; i < 4; ++i) {
        if (static_cast<unsigned char>(bytes[i]) != magic[i]) return false;
    }
    return true;
}

bool has_pdf_signature(const std::vector<char>& bytes) {
    return bytes.size() >= 5 && std::string(bytes.data(), 5) == "%PDF-";
}

} // namespace stmt
