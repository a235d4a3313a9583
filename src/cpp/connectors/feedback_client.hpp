#pragma once
// FeedbackSink over the classifier API: POST {api}/api/v1/feedback
#include "import_sink.hpp"
#include "http_client.hpp"
#include "../config.hpp"

namespace stmt {

class FeedbackClient : public FeedbackSink {
public:
    FeedbackClient(HttpTransport& http, const IngestConfig& cfg)
        : http_(http),
          url_(join_url(cfg.api.base_url, cfg.api.feedback_path)),
          token_(cfg.auth.access_token),
          timeout_ms_(cfg.timeouts.feedback_ms) {}

    // Throws NetworkError on a non-2xx answer
    void submit(const std::map<std::string, std::string>& corrections) override;

private:
    HttpTransport& http_;
    std::string url_;
    std::string token_;
    long timeout_ms_;
};

} // namespace stmt
