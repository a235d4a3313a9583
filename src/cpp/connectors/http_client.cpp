#include "http_client.hpp"
#include "../errors.hpp"
#include "../utils/logger.hpp"

#include <curl/curl.h>

namespace stmt {

// ---- curl write callback ----
static size_t curl_write_cb(char* ptr, size_t size, size_t nmemb, std::string* data) {
    data->append(ptr, size * nmemb);
    return size * nmemb;
}

namespace {

// Owns the easy handle and header list of one request
class CurlRequest {
public:
    CurlRequest() : curl_(curl_easy_init()) {
        if (!curl_) throw NetworkError("curl_easy_init failed");
    }
    ~CurlRequest() {
        if (headers_) curl_slist_free_all(headers_);
        if (mime_) curl_mime_free(mime_);
        curl_easy_cleanup(curl_);
    }

    CurlRequest(const CurlRequest&) = delete;
    CurlRequest& operator=(const CurlRequest&) = delete;

    CURL* handle() { return curl_; }

    void add_header(const std::string& h) { headers_ = curl_slist_append(headers_, h.c_str()); }

    curl_mime* mime() {
        if (!mime_) mime_ = curl_mime_init(curl_);
        return mime_;
    }

    HttpResponse perform(const std::string& url, long timeout_ms) {
        HttpResponse resp;
        curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, curl_write_cb);
        curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &resp.body);
        curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, timeout_ms);
        curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
        if (headers_) curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers_);

        CURLcode res = curl_easy_perform(curl_);
        if (res == CURLE_OPERATION_TIMEDOUT) {
            LOG_WRN("[http] POST %s timed out after %ld ms", url.c_str(), timeout_ms);
            throw TimeoutError("Request to " + url + " timed out");
        }
        if (res != CURLE_OK) {
            LOG_ERR("[http] POST %s failed: %s", url.c_str(), curl_easy_strerror(res));
            throw NetworkError(std::string("Request to ") + url + " failed: " + curl_easy_strerror(res));
        }
        curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &resp.status);
        LOG_DBG("[http] POST %s -> %ld (%zu bytes)", url.c_str(), resp.status, resp.body.size());
        return resp;
    }

private:
    CURL* curl_;
    struct curl_slist* headers_ = nullptr;
    curl_mime* mime_ = nullptr;
};

} // namespace

HttpResponse CurlHttpClient::post_json(const std::string& url,
                                       const std::string& body,
                                       const std::vector<std::string>& headers,
                                       long timeout_ms) {
    CurlRequest req;
    req.add_header("Content-Type: application/json");
    req.add_header("Accept: application/json");
    for (const auto& h : headers) req.add_header(h);

    curl_easy_setopt(req.handle(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(req.handle(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    return req.perform(url, timeout_ms);
}

HttpResponse CurlHttpClient::post_multipart(const std::string& url,
                                            const std::vector<MultipartField>& fields,
                                            const std::vector<std::string>& headers,
                                            long timeout_ms) {
    CurlRequest req;
    for (const auto& h : headers) req.add_header(h);

    curl_mime* mime = req.mime();
    for (const auto& f : fields) {
        curl_mimepart* part = curl_mime_addpart(mime);
        curl_mime_name(part, f.name.c_str());
        curl_mime_data(part, f.value.data(), f.value.size());
        if (!f.filename.empty()) curl_mime_filename(part, f.filename.c_str());
        if (!f.content_type.empty()) curl_mime_type(part, f.content_type.c_str());
    }
    curl_easy_setopt(req.handle(), CURLOPT_MIMEPOST, mime);
    return req.perform(url, timeout_ms);
}

std::vector<std::string> bearer_headers(const std::string& token) {
    if (token.empty()) return {};
    return {"Authorization: Bearer " + token};
}

std::string join_url(const std::string& base, const std::string& path) {
    if (base.empty()) return path;
    if (path.empty()) return base;
    const bool base_slash = base.back() == '/';
    const bool path_slash = path.front() == '/';
    if (base_slash && path_slash) return base + path.substr(1);
    if (!base_slash && !path_slash) return base + "/" + path;
    return base + path;
}

} // namespace stmt
