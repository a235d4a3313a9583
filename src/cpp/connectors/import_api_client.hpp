#pragma once
// ImportSink over the web backend: POST {web}/api/import
#include "import_sink.hpp"
#include "http_client.hpp"
#include "../config.hpp"

namespace stmt {

class ImportApiClient : public ImportSink {
public:
    ImportApiClient(HttpTransport& http, const IngestConfig& cfg)
        : http_(http),
          url_(join_url(cfg.web.base_url, cfg.web.import_path)),
          token_(cfg.auth.access_token),
          timeout_ms_(cfg.timeouts.import_ms) {}

    InsertCounts insert_batch(const std::vector<CanonicalTransaction>& records,
                              const BatchFile& file) override;

    [[nodiscard]] const char* sink_name() const override { return "api"; }

    // Request body for one chunk
    static nlohmann::json build_body(const std::vector<CanonicalTransaction>& records,
                                     const BatchFile& file);

    // {inserted, skipped_duplicates, skipped_zero_amount}; throws NetworkError
    static InsertCounts parse_counts(const std::string& body);

private:
    HttpTransport& http_;
    std::string url_;
    std::string token_;
    long timeout_ms_;
};

// Best human-readable error from a JSON error body ("error" or "message")
std::string error_message_from_body(const std::string& body);

} // namespace stmt
