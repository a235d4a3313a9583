#include "description_normalizer.hpp"
#include "../utils/text.hpp"

#include <regex>
#include <unordered_map>
#include <unordered_set>

namespace stmt {

std::string normalize_description(const std::string& description) {
    using std::regex;
    static const regex order_id(R"(#\d+[-\d]*)");
    static const regex txn_id(R"(\btxn_\d+)", regex::ECMAScript | regex::icase);
    static const regex upi_ref(R"(UPI\/([^/]+)\/\d+)", regex::ECMAScript | regex::icase);
    static const regex vpa_number(R"(-\d+@)");
    static const regex dmy(R"(\b\d{1,2}[\/-]\d{1,2}[\/-]\d{4}\b)");
    static const regex ymd(R"(\b\d{4}-\d{2}-\d{2}\b)");
    static const regex money(R"(\b(RS\.?|INR|₹)\s*(\d+\.?\d*))", regex::ECMAScript | regex::icase);
    static const regex long_number(R"(\b\d{5,}\b)");

    std::string s = text::to_lower(text::trim(description));
    s = std::regex_replace(s, order_id, "#ORDER");
    s = std::regex_replace(s, txn_id, "txn_XXXXX");
    s = std::regex_replace(s, upi_ref, "upi/$1/XXXXXXXXX");
    s = std::regex_replace(s, vpa_number, "-XXXXX@");
    s = std::regex_replace(s, dmy, "DD/MM/YYYY");
    s = std::regex_replace(s, ymd, "YYYY-MM-DD");
    s = std::regex_replace(s, money, "$1 XXXX.XX");
    s = std::regex_replace(s, long_number, "XXXXX");
    return s;
}

std::vector<ClassificationGroup> group_descriptions(const std::vector<std::string>& descriptions) {
    std::vector<ClassificationGroup> groups;
    std::unordered_map<std::string, size_t> index;
    std::unordered_set<std::string> seen;

    for (const auto& d : descriptions) {
        if (!seen.insert(d).second) continue;
        std::string key = normalize_description(d);
        if (key.empty()) continue;

        auto it = index.find(key);
        if (it == index.end()) {
            index.emplace(key, groups.size());
            groups.push_back({std::move(key), {d}});
        } else {
            groups[it->second].descriptions.push_back(d);
        }
    }
    return groups;
}

} // namespace stmt
