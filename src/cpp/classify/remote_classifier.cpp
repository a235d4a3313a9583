#include "remote_classifier.hpp"
#include "../errors.hpp"
#include "../utils/logger.hpp"

#include <nlohmann/json.hpp>

namespace stmt {

std::unordered_map<std::string, std::string> RemoteClassifier::parse_predictions(const std::string& body) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(body);
    } catch (const nlohmann::json::exception& e) {
        throw NetworkError(std::string("Malformed classifier response: ") + e.what());
    }

    if (j.is_object() && j.contains("categories") && j["categories"].is_object()) {
        j = j["categories"];
    }
    if (!j.is_object()) {
        throw NetworkError("Classifier response is not an object");
    }

    std::unordered_map<std::string, std::string> out;
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (it.value().is_string() && !it.value().get<std::string>().empty()) {
            out.emplace(it.key(), it.value().get<std::string>());
        }
    }
    return out;
}

ClassifierOutput RemoteClassifier::classify(const std::vector<ClassifyItem>& items) {
    ClassifierOutput out;
    out.source = name();
    if (items.empty()) return out;

    nlohmann::json descriptions = nlohmann::json::array();
    for (const auto& item : items) descriptions.push_back(item.description);
    const std::string body = nlohmann::json{{"descriptions", descriptions}}.dump();

    LOG_DBG("[classify] POST %s (%zu descriptions)", url_.c_str(), items.size());
    HttpResponse resp = http_.post_json(url_, body, bearer_headers(token_), timeout_ms_);
    if (!resp.ok()) {
        throw NetworkError("Classifier returned HTTP " + std::to_string(resp.status), resp.status);
    }

    out.predictions = parse_predictions(resp.body);
    LOG_INF("[classify] remote classifier answered %zu of %zu", out.predictions.size(), items.size());
    return out;
}

} // namespace stmt
