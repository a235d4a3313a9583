#include "import_api_client.hpp"
#include "../errors.hpp"

namespace stmt {

std::string error_message_from_body(const std::string& body) {
    try {
        auto j = nlohmann::json::parse(body);
        if (j.is_object()) {
            for (const char* key : {"error", "message", "detail"}) {
                if (j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
            }
        }
    } catch (const nlohmann::json::exception&) {
        // not JSON: fall through to the raw text
    }
    return body.size() > 200 ? body.substr(0, 200) + "..." : body;
}

nlohmann::json ImportApiClient::build_body(const std::vector<CanonicalTransaction>& records,
                                           const BatchFile& file) {
    nlohmann::json txs = nlohmann::json::array();
    for (const auto& r : records) txs.push_back(r.to_wire_json());
    return {
        {"transactions", std::move(txs)},
        {"filename", file.filename},
        {"file_hash", file.file_hash},
    };
}

InsertCounts ImportApiClient::parse_counts(const std::string& body) {
    try {
        auto j = nlohmann::json::parse(body);
        InsertCounts c;
        c.inserted = j.value("inserted", int64_t{0});
        c.skipped_duplicates = j.value("skipped_duplicates", int64_t{0});
        c.skipped_zero_amount = j.value("skipped_zero_amount", int64_t{0});
        return c;
    } catch (const nlohmann::json::exception& e) {
        throw NetworkError(std::string("Malformed import response: ") + e.what());
    }
}

InsertCounts ImportApiClient::insert_batch(const std::vector<CanonicalTransaction>& records,
                                           const BatchFile& file) {
    const std::string body = build_body(records, file).dump();

#ifdef STMT_DRY_RUN
    LOG_INF("[import-api] DRY RUN: POST %s (%zu rows, %zu bytes)",
        url_.c_str(), records.size(), body.size());
    InsertCounts dry;
    dry.inserted = static_cast<int64_t>(records.size());
    return dry;
#endif

    HttpResponse resp = http_.post_json(url_, body, bearer_headers(token_), timeout_ms_);
    if (resp.status == 401) {
        throw NetworkError("Import rejected: not authenticated", resp.status);
    }
    if (!resp.ok()) {
        throw NetworkError("Import failed (HTTP " + std::to_string(resp.status) + "): " +
                           error_message_from_body(resp.body), resp.status);
    }

    InsertCounts c = parse_counts(resp.body);
    LOG_DBG("[import-api] chunk of %zu: inserted=%lld dup=%lld zero=%lld",
        records.size(), static_cast<long long>(c.inserted),
        static_cast<long long>(c.skipped_duplicates), static_cast<long long>(c.skipped_zero_amount));
    return c;
}

} // namespace stmt
