#pragma once
// =============================================================================
// Raw Row: one table row exactly as the extractor produced it
//
// Keys keep their source spelling and order (the row normalizer matches on a
// normalized form). Cells stay typed so JSON exports keep numbers as numbers.
// A copy of every row travels with the canonical record as raw_data.
// =============================================================================

#include <cstdint>
#include <cstdio>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace stmt {

// ============================================================================
// Typed cell value (null, bool, integer, double, string)
// ============================================================================

using CellValue = std::variant<
    std::monostate,   // empty / null
    bool,
    int64_t,
    double,
    std::string
>;

// Display form of a cell, used for parsing and narration
inline std::string cell_to_string(const CellValue& v) {
    return std::visit([](const auto& x) -> std::string {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "";
        } else if constexpr (std::is_same_v<T, bool>) {
            return x ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(x);
        } else if constexpr (std::is_same_v<T, double>) {
            char buf[64];
            std::snprintf(buf, sizeof(buf), "%.15g", x);
            return buf;
        } else {
            return x;
        }
    }, v);
}

inline nlohmann::json cell_to_json(const CellValue& v) {
    return std::visit([](const auto& x) -> nlohmann::json {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return nullptr;
        } else {
            return x;
        }
    }, v);
}

// Works for both nlohmann::json and nlohmann::ordered_json
template <typename Json>
inline CellValue cell_from_json(const Json& j) {
    if (j.is_null()) return std::monostate{};
    if (j.is_boolean()) return j.template get<bool>();
    if (j.is_number_integer()) return j.template get<int64_t>();
    if (j.is_number_float()) return j.template get<double>();
    if (j.is_string()) return j.template get<std::string>();
    return j.dump();   // nested arrays / objects keep their JSON text
}

// ============================================================================
// RawRow: ordered key -> cell entries
// ============================================================================

struct RawRow {
    std::vector<std::pair<std::string, CellValue>> cells;

    void set_null(const std::string& key) { set(key, std::monostate{}); }
    void set_text(const std::string& key, std::string val) { set(key, CellValue(std::move(val))); }
    void set_int(const std::string& key, int64_t val) { set(key, val); }
    void set_double(const std::string& key, double val) { set(key, val); }

    // Overwrites an existing key in place, otherwise appends
    void set(const std::string& key, CellValue val) {
        for (auto& [k, v] : cells) {
            if (k == key) {
                v = std::move(val);
                return;
            }
        }
        cells.emplace_back(key, std::move(val));
    }

    [[nodiscard]] const CellValue* find(const std::string& key) const {
        for (const auto& [k, v] : cells) {
            if (k == key) return &v;
        }
        return nullptr;
    }

    [[nodiscard]] std::string text(const std::string& key) const {
        const CellValue* v = find(key);
        return v ? cell_to_string(*v) : std::string();
    }

    [[nodiscard]] bool empty() const { return cells.empty(); }
    [[nodiscard]] size_t size() const { return cells.size(); }

    // True when every cell is null or an empty string
    [[nodiscard]] bool all_blank() const {
        for (const auto& [k, v] : cells) {
            if (!cell_to_string(v).empty()) return false;
        }
        return true;
    }

    [[nodiscard]] nlohmann::json to_json() const {
        nlohmann::json j = nlohmann::json::object();
        for (const auto& [k, v] : cells) j[k] = cell_to_json(v);
        return j;
    }
};

} // namespace stmt
