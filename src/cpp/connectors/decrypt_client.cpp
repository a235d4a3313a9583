#include "decrypt_client.hpp"
#include "import_api_client.hpp"
#include "../errors.hpp"

namespace stmt {

std::vector<char> DecryptClient::decrypt(const std::vector<char>& bytes,
                                         const std::string& filename,
                                         const std::string& password) {
    std::vector<MultipartField> fields = {
        {"file", std::string(bytes.begin(), bytes.end()), filename, "application/octet-stream"},
        {"password", password, "", ""},
    };

    LOG_INF("[decrypt] sending %s (%zu bytes) for decryption", filename.c_str(), bytes.size());
    HttpResponse resp = http_.post_multipart(url_, fields, bearer_headers(token_), timeout_ms_);

    if (resp.status == 400) {
        throw EncryptionError("Incorrect password or unsupported encryption: " +
                              error_message_from_body(resp.body));
    }
    if (!resp.ok()) {
        throw NetworkError("Decryption failed (HTTP " + std::to_string(resp.status) + "): " +
                           error_message_from_body(resp.body), resp.status);
    }
    return std::vector<char>(resp.body.begin(), resp.body.end());
}

} // namespace stmt
