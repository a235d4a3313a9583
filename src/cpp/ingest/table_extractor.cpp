#include "table_extractor.hpp"
#include "../errors.hpp"
#include "../utils/logger.hpp"
#include "../utils/text.hpp"

#include <algorithm>
#include <map>
#include <nlohmann/json.hpp>

namespace stmt {

namespace {

constexpr size_t kHeaderScanRows = 30;
constexpr size_t kMinHeaderHits = 2;
constexpr const char* kEmptyKey = "__EMPTY";
constexpr const char* kExtraKey = "__parsed_extra";

bool is_synthetic_key(const std::string& key) {
    return text::starts_with(key, kEmptyKey);
}

// Makes header names unique: "Amount", "Amount" -> "Amount", "Amount_1"
class KeyAllocator {
public:
    std::string unique(const std::string& name) {
        auto it = seen_.find(name);
        if (it == seen_.end()) {
            seen_[name] = 0;
            return name;
        }
        std::string candidate;
        do {
            candidate = name + "_" + std::to_string(++it->second);
        } while (seen_.count(candidate));
        seen_[candidate] = 0;
        return candidate;
    }

private:
    std::map<std::string, int> seen_;
};

std::vector<std::string> sheet_header_keys(const std::vector<std::string>& header_row, size_t width) {
    KeyAllocator keys;
    std::vector<std::string> out;
    out.reserve(width);
    for (size_t c = 0; c < width; ++c) {
        std::string name = c < header_row.size() ? text::trim(header_row[c]) : std::string();
        out.push_back(keys.unique(name.empty() ? std::string(kEmptyKey) : name));
    }
    return out;
}

std::string joined_trimmed_lines(const std::string& text) {
    std::string out;
    for (const auto& line : text::split_any(text, "\n")) {
        std::string t = text::trim(line);
        if (t.empty()) continue;
        if (!out.empty()) out += '\n';
        out += t;
    }
    return out;
}

} // namespace

const std::vector<std::string>& header_keywords() {
    static const std::vector<std::string> words = {
        "date", "txn", "transaction", "value", "description", "narration",
        "debit", "credit", "amount", "withdrawal", "deposit", "balance",
        "ref", "chq", "cheque", "particulars", "remark"};
    return words;
}

bool contains_header_keyword(const std::string& cell) {
    const std::string lower = text::to_lower(cell);
    for (const auto& w : header_keywords()) {
        if (text::contains(lower, w)) return true;
    }
    return false;
}

// ============================================================================
// Delimited text
// ============================================================================

Grid parse_delimited(const std::string& text, char delim) {
    Grid records;
    std::vector<std::string> record;
    std::string field;
    bool in_quotes = false;
    bool field_started = false;

    auto end_field = [&]() {
        record.push_back(std::move(field));
        field.clear();
        field_started = false;
    };
    auto end_record = [&]() {
        end_field();
        // a lone empty field is a blank line
        if (!(record.size() == 1 && record[0].empty())) {
            records.push_back(std::move(record));
        }
        record.clear();
    };

    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field += c;
            }
            continue;
        }

        if (c == '"' && !field_started) {
            in_quotes = true;
            field_started = true;
        } else if (c == delim) {
            end_field();
        } else if (c == '\r') {
            if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
            end_record();
        } else if (c == '\n') {
            end_record();
        } else {
            field += c;
            field_started = true;
        }
    }
    if (field_started || !field.empty() || !record.empty()) {
        end_record();
    }
    return records;
}

char sniff_delimiter(const std::string& first_line) {
    static const char candidates[] = {',', '\t', '|', ';'};
    char best = ',';
    size_t best_fields = 0;
    for (char d : candidates) {
        Grid g = parse_delimited(first_line, d);
        size_t n = g.empty() ? 0 : g.front().size();
        if (n > best_fields) {
            best_fields = n;
            best = d;
        }
    }
    return best;
}

std::vector<RawRow> extract_delimited(const std::string& text) {
    const std::string body = joined_trimmed_lines(text);
    if (body.empty()) return {};

    const std::string first_line = body.substr(0, body.find('\n'));
    const char delim = sniff_delimiter(first_line);
    Grid records = parse_delimited(body, delim);
    if (records.empty()) return {};

    KeyAllocator keys;
    std::vector<std::string> header;
    for (const auto& name : records.front()) {
        header.push_back(keys.unique(text::trim(name)));
    }

    std::vector<RawRow> rows;
    for (size_t r = 1; r < records.size(); ++r) {
        const auto& rec = records[r];
        RawRow row;
        for (size_t c = 0; c < header.size(); ++c) {
            row.set_text(header[c], c < rec.size() ? rec[c] : std::string());
        }
        for (size_t c = header.size(), extra = 0; c < rec.size(); ++c, ++extra) {
            std::string key = extra == 0 ? std::string(kExtraKey)
                                         : std::string(kExtraKey) + "_" + std::to_string(extra);
            row.set_text(key, rec[c]);
        }
        if (row.all_blank()) continue;
        rows.push_back(std::move(row));
    }

    LOG_DBG("[extract] delimited: delimiter='%c' columns=%zu rows=%zu",
        delim == '\t' ? 'T' : delim, header.size(), rows.size());
    return rows;
}

// ============================================================================
// Spreadsheet grids
// ============================================================================

std::vector<RawRow> rows_from_grid(const Grid& grid) {
    // the used range starts at the first row holding any value
    size_t first = 0;
    auto blank = [](const std::vector<std::string>& r) {
        for (const auto& c : r) {
            if (!text::trim(c).empty()) return false;
        }
        return true;
    };
    while (first < grid.size() && blank(grid[first])) ++first;
    if (first == grid.size()) return {};

    size_t width = 0;
    for (const auto& r : grid) width = std::max(width, r.size());
    const auto keys = sheet_header_keys(grid[first], width);

    std::vector<RawRow> rows;
    for (size_t r = first + 1; r < grid.size(); ++r) {
        RawRow row;
        for (size_t c = 0; c < width; ++c) {
            row.set_text(keys[c], c < grid[r].size() ? grid[r][c] : std::string());
        }
        if (row.all_blank()) continue;
        rows.push_back(std::move(row));
    }
    return rows;
}

std::vector<RawRow> repair_headers(std::vector<RawRow> rows) {
    if (rows.empty()) return rows;

    bool all_synthetic = true;
    bool has_keyword = false;
    for (const auto& [key, _] : rows.front().cells) {
        if (!is_synthetic_key(key)) all_synthetic = false;
        if (contains_header_keyword(key)) has_keyword = true;
    }
    if (!all_synthetic && has_keyword) return rows;

    // Rebuild rows below a new header row, mapping cells by position
    auto rebuild = [&rows](size_t header_idx, bool numbered_blanks) {
        KeyAllocator keys;
        std::vector<std::string> header;
        const auto& hdr = rows[header_idx].cells;
        for (size_t c = 0; c < hdr.size(); ++c) {
            std::string name = text::trim(cell_to_string(hdr[c].second));
            if (name.empty()) {
                name = numbered_blanks ? "column_" + std::to_string(c + 1) : std::string(kEmptyKey);
            }
            header.push_back(keys.unique(name));
        }

        std::vector<RawRow> out;
        for (size_t r = header_idx + 1; r < rows.size(); ++r) {
            RawRow row;
            const auto& cells = rows[r].cells;
            for (size_t c = 0; c < header.size(); ++c) {
                row.set(header[c], c < cells.size() ? cells[c].second : CellValue(std::string()));
            }
            if (row.all_blank()) continue;
            out.push_back(std::move(row));
        }
        return out;
    };

    const size_t scan = std::min(rows.size(), kHeaderScanRows);
    for (size_t r = 0; r < scan; ++r) {
        size_t hits = 0;
        for (const auto& [_, v] : rows[r].cells) {
            if (contains_header_keyword(cell_to_string(v))) ++hits;
        }
        if (hits >= kMinHeaderHits) {
            LOG_DBG("[extract] header row found at sheet row %zu (%zu keyword cells)", r + 2, hits);
            return rebuild(r, true);
        }
    }

    if (all_synthetic) {
        LOG_DBG("[extract] no header keywords, promoting first row to header");
        return rebuild(0, false);
    }
    return rows;
}

std::vector<RawRow> extract_grid(const Grid& grid) {
    return repair_headers(rows_from_grid(grid));
}

// ============================================================================
// JSON
// ============================================================================

std::vector<RawRow> extract_json(const std::string& text) {
    if (text::trim(text).empty()) return {};

    nlohmann::ordered_json doc;
    try {
        doc = nlohmann::ordered_json::parse(text);
    } catch (const nlohmann::json::exception& e) {
        throw FormatError(std::string("Invalid JSON file: ") + e.what());
    }

    const nlohmann::ordered_json* entries = nullptr;
    if (doc.is_array()) {
        entries = &doc;
    } else if (doc.is_object() && doc.contains("transactions") && doc["transactions"].is_array()) {
        entries = &doc["transactions"];
    }
    if (!entries || entries->empty()) return {};

    std::vector<RawRow> rows;
    for (const auto& entry : *entries) {
        if (!entry.is_object()) continue;
        RawRow row;
        for (auto it = entry.begin(); it != entry.end(); ++it) {
            row.set(it.key(), cell_from_json(it.value()));
        }
        rows.push_back(std::move(row));
    }

    if (rows.empty()) {
        throw FormatError("JSON file contains no valid transaction objects");
    }
    return rows;
}

} // namespace stmt
