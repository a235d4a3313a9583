#pragma once
// Deterministic keyword table; used offline and when the remote service fails
#include "classifier.hpp"

#include <utility>

namespace stmt {

struct CategoryKeywords {
    std::string category;
    std::vector<std::string> keywords;   // lower-case
};

class KeywordClassifier : public Classifier {
public:
    KeywordClassifier();
    explicit KeywordClassifier(std::vector<CategoryKeywords> table) : table_(std::move(table)) {}

    static const std::vector<CategoryKeywords>& default_table();

    ClassifierOutput classify(const std::vector<ClassifyItem>& items) override;
    [[nodiscard]] const char* name() const override { return "keywords"; }

    // First category whose keyword occurs in "description merchant", or
    // "Uncategorized". Keywords of four characters or fewer must be whole words.
    [[nodiscard]] std::string categorize(const std::string& description, const std::string& merchant) const;

private:
    std::vector<CategoryKeywords> table_;
};

} // namespace stmt
