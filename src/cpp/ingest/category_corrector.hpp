#pragma once
// User category corrections, applied to a transaction and every similar one
// (same description, or same known merchant). Moving into or out of "income"
// flips the amount sign; fingerprints are left as stored.
#include <map>
#include <string>
#include <vector>

#include "transaction.hpp"
#include "../connectors/import_sink.hpp"

namespace stmt {

struct CorrectionResult {
    size_t updated = 0;
    // description -> new category, for every transaction that changed
    std::map<std::string, std::string> feedback;
};

class CategoryCorrector {
public:
    explicit CategoryCorrector(FeedbackSink* feedback = nullptr) : feedback_(feedback) {}

    static bool similar(const CanonicalTransaction& a, const CanonicalTransaction& b);

    // Throws ImportError when target_id is not in the list. Feedback is
    // submitted best-effort; its failure is only logged.
    CorrectionResult correct(std::vector<CanonicalTransaction>& transactions,
                             const std::string& target_id,
                             const std::string& new_category);

private:
    FeedbackSink* feedback_;
};

} // namespace stmt
