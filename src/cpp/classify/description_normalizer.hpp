#pragma once
// Groups descriptions that differ only in order ids, dates, amounts or
// reference numbers, so one classification answers for all of them.
#include <string>
#include <vector>

namespace stmt {

// Lower-cased, trimmed, variable parts replaced by fixed placeholders
std::string normalize_description(const std::string& description);

struct ClassificationGroup {
    std::string key;                           // normalized form
    std::vector<std::string> descriptions;     // distinct originals, first-seen order

    [[nodiscard]] const std::string& representative() const { return descriptions.front(); }
};

// Distinct descriptions grouped by normalized key, in first-seen order.
// Descriptions that normalize to "" are left out.
std::vector<ClassificationGroup> group_descriptions(const std::vector<std::string>& descriptions);

} // namespace stmt
