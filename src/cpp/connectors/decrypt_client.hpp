#pragma once
// Decryptor over the web backend: multipart POST {web}/api/decrypt-xlsx
#include "import_sink.hpp"
#include "http_client.hpp"
#include "../config.hpp"

namespace stmt {

class DecryptClient : public Decryptor {
public:
    DecryptClient(HttpTransport& http, const IngestConfig& cfg)
        : http_(http),
          url_(join_url(cfg.web.base_url, cfg.web.decrypt_path)),
          token_(cfg.auth.access_token),
          timeout_ms_(cfg.timeouts.decrypt_ms) {}

    // HTTP 400 means a wrong password (EncryptionError); other failures are
    // NetworkError
    std::vector<char> decrypt(const std::vector<char>& bytes,
                              const std::string& filename,
                              const std::string& password) override;

private:
    HttpTransport& http_;
    std::string url_;
    std::string token_;
    long timeout_ms_;
};

} // namespace stmt
