#pragma once
// Remote classifier with keyword fallback: any exception from the primary is
// logged and the secondary answers instead. Classification never fails an
// import.
#include "classifier.hpp"

namespace stmt {

class FallbackClassifier : public Classifier {
public:
    FallbackClassifier(Classifier& primary, Classifier& secondary)
        : primary_(primary), secondary_(secondary) {}

    ClassifierOutput classify(const std::vector<ClassifyItem>& items) override;
    [[nodiscard]] const char* name() const override { return "fallback"; }

private:
    Classifier& primary_;
    Classifier& secondary_;
};

} // namespace stmt
