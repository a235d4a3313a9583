#pragma once
// Batch classification over HTTP: POST {api}/api/v1/classify
//   request  {"descriptions": [...]}
//   response {"<description>": "<category>", ...}
#include "classifier.hpp"
#include "../config.hpp"
#include "../connectors/http_client.hpp"

namespace stmt {

class RemoteClassifier : public Classifier {
public:
    RemoteClassifier(HttpTransport& http, const IngestConfig& cfg)
        : http_(http),
          url_(join_url(cfg.api.base_url, cfg.api.classify_path)),
          token_(cfg.auth.access_token),
          timeout_ms_(cfg.timeouts.classify_ms) {}

    // Throws NetworkError / TimeoutError; never returns partial garbage
    ClassifierOutput classify(const std::vector<ClassifyItem>& items) override;
    [[nodiscard]] const char* name() const override { return "remote"; }

    // Accepts the flat map, or the same map under "categories"
    static std::unordered_map<std::string, std::string> parse_predictions(const std::string& body);

private:
    HttpTransport& http_;
    std::string url_;
    std::string token_;
    long timeout_ms_;
};

} // namespace stmt
