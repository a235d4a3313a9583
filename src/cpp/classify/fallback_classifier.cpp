#include "fallback_classifier.hpp"
#include "../utils/logger.hpp"

#include <exception>

namespace stmt {

ClassifierOutput FallbackClassifier::classify(const std::vector<ClassifyItem>& items) {
    try {
        return primary_.classify(items);
    } catch (const std::exception& e) {
        LOG_WRN("[classify] %s classifier failed (%s), falling back to %s",
            primary_.name(), e.what(), secondary_.name());
    }
    return secondary_.classify(items);
}

} // namespace stmt
