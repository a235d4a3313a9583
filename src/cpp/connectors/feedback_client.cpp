#include "feedback_client.hpp"
#include "../errors.hpp"

namespace stmt {

void FeedbackClient::submit(const std::map<std::string, std::string>& corrections) {
    if (corrections.empty()) return;

    nlohmann::json body = {{"corrections", corrections}};
    HttpResponse resp = http_.post_json(url_, body.dump(), bearer_headers(token_), timeout_ms_);
    if (!resp.ok()) {
        throw NetworkError("Feedback rejected (HTTP " + std::to_string(resp.status) + ")", resp.status);
    }
    LOG_INF("[feedback] submitted %zu corrections", corrections.size());
}

} // namespace stmt
