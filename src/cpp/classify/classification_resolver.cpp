#include "classification_resolver.hpp"
#include "description_normalizer.hpp"
#include "../utils/logger.hpp"

#include <unordered_map>

namespace stmt {

ClassificationReport ClassificationResolver::classify(std::vector<CanonicalTransaction>& rows) {
    ClassificationReport report;
    report.classifier_used = classifier_.name();
    if (rows.empty()) return report;

    std::vector<std::string> descriptions;
    descriptions.reserve(rows.size());
    for (const auto& r : rows) descriptions.push_back(r.description);

    const auto groups = group_descriptions(descriptions);
    report.groups = groups.size();
    if (groups.empty()) return report;

    // representative -> merchant of the first row carrying it
    std::unordered_map<std::string, std::string> merchant_of;
    for (const auto& r : rows) merchant_of.emplace(r.description, r.merchant);

    std::vector<ClassifyItem> items;
    items.reserve(groups.size());
    for (const auto& g : groups) {
        items.push_back({g.representative(), merchant_of[g.representative()]});
    }

    ClassifierOutput out = classifier_.classify(items);
    report.classifier_used = out.source.empty() ? classifier_.name() : out.source;

    if (out.per_row) {
        for (auto& r : rows) {
            std::string category = out.per_row(r.description, r.merchant);
            if (category == kUncategorized) continue;
            r.category = std::move(category);
            ++report.rows_categorized;
        }
        LOG_INF("[classify] %zu rows categorized row by row by %s (%lld matched)",
            rows.size(), report.classifier_used.c_str(), static_cast<long long>(report.rows_categorized));
        return report;
    }

    // every original description -> category of its group representative
    std::unordered_map<std::string, std::string> category_of;
    for (const auto& g : groups) {
        auto it = out.predictions.find(g.representative());
        if (it == out.predictions.end()) continue;
        for (const auto& d : g.descriptions) category_of[d] = it->second;
    }

    for (auto& r : rows) {
        auto it = category_of.find(r.description);
        if (it == category_of.end()) continue;
        r.category = it->second;
        ++report.rows_categorized;
    }

    LOG_INF("[classify] %zu rows in %zu groups, %lld categorized by %s",
        rows.size(), groups.size(), static_cast<long long>(report.rows_categorized),
        report.classifier_used.c_str());
    return report;
}

} // namespace stmt
