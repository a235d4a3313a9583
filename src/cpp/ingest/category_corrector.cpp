#include "category_corrector.hpp"
#include "../errors.hpp"
#include "../utils/logger.hpp"

#include <exception>

namespace stmt {

bool CategoryCorrector::similar(const CanonicalTransaction& a, const CanonicalTransaction& b) {
    if (a.description == b.description) return true;
    return a.merchant == b.merchant && a.merchant != kUnknownMerchant && !a.merchant.empty();
}

CorrectionResult CategoryCorrector::correct(std::vector<CanonicalTransaction>& transactions,
                                            const std::string& target_id,
                                            const std::string& new_category) {
    const CanonicalTransaction* target = nullptr;
    for (const auto& t : transactions) {
        if (t.id == target_id) {
            target = &t;
            break;
        }
    }
    if (!target) throw ImportError("Transaction not found: " + target_id);

    // copy: the target itself is mutated below
    const CanonicalTransaction probe = *target;

    CorrectionResult result;
    for (auto& t : transactions) {
        if (t.id != target_id && !similar(probe, t)) continue;
        if (!t.apply_category_correction(new_category)) continue;
        ++result.updated;
        result.feedback[t.description] = new_category;
    }

    LOG_INF("[correct] '%s' -> %s: %zu transactions updated",
        probe.description.c_str(), new_category.c_str(), result.updated);

    if (feedback_ && !result.feedback.empty()) {
        try {
            feedback_->submit(result.feedback);
        } catch (const std::exception& e) {
            LOG_WRN("[correct] feedback submission failed: %s", e.what());
        }
    }
    return result;
}

} // namespace stmt
