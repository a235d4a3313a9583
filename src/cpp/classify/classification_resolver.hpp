#pragma once
// Assigns categories to a batch: one classifier call per distinct normalized
// description, answer fanned out to every row of the group. Local classifiers
// that return per_row are applied to each row with its own merchant.
#include <cstdint>
#include <string>
#include <vector>

#include "classifier.hpp"
#include "../ingest/transaction.hpp"

namespace stmt {

struct ClassificationReport {
    std::string classifier_used;
    size_t groups = 0;
    int64_t rows_categorized = 0;
};

class ClassificationResolver {
public:
    explicit ClassificationResolver(Classifier& classifier) : classifier_(classifier) {}

    // Rows without a prediction keep their current category
    ClassificationReport classify(std::vector<CanonicalTransaction>& rows);

private:
    Classifier& classifier_;
};

} // namespace stmt
