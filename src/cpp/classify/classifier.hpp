#pragma once
// Category prediction seam. Implementations: RemoteClassifier (HTTP),
// KeywordClassifier (local table) and FallbackClassifier (remote, then
// keywords on failure).
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace stmt {

struct ClassifyItem {
    std::string description;
    std::string merchant;
};

struct ClassifierOutput {
    // description -> category; a missing description means no prediction
    std::unordered_map<std::string, std::string> predictions;
    std::string source;   // name of the classifier that answered

    // Set by local classifiers that decide on each row's own description and
    // merchant. The resolver then categorizes row by row instead of copying
    // the group answer.
    std::function<std::string(const std::string& description, const std::string& merchant)> per_row;
};

class Classifier {
public:
    virtual ~Classifier() = default;

    virtual ClassifierOutput classify(const std::vector<ClassifyItem>& items) = 0;

    [[nodiscard]] virtual const char* name() const = 0;
};

} // namespace stmt
