#pragma once
// Minimal HTTP POST transport over libcurl.
// One easy handle per request, so a client may be shared across threads;
// curl_global_init must have run (main does it).
#include <string>
#include <vector>

namespace stmt {

struct HttpResponse {
    long status = 0;
    std::string body;

    [[nodiscard]] bool ok() const { return status >= 200 && status < 300; }
};

struct MultipartField {
    std::string name;
    std::string value;          // text value, or the file bytes
    std::string filename;       // non-empty: sent as a file part
    std::string content_type;
};

// Transport seam; tests substitute a scripted fake
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // Throws TimeoutError when the deadline expires, NetworkError on any other
    // transport failure. HTTP error statuses are returned, not thrown.
    virtual HttpResponse post_json(const std::string& url,
                                   const std::string& body,
                                   const std::vector<std::string>& headers,
                                   long timeout_ms) = 0;

    virtual HttpResponse post_multipart(const std::string& url,
                                        const std::vector<MultipartField>& fields,
                                        const std::vector<std::string>& headers,
                                        long timeout_ms) = 0;
};

class CurlHttpClient : public HttpTransport {
public:
    HttpResponse post_json(const std::string& url,
                           const std::string& body,
                           const std::vector<std::string>& headers,
                           long timeout_ms) override;

    HttpResponse post_multipart(const std::string& url,
                                const std::vector<MultipartField>& fields,
                                const std::vector<std::string>& headers,
                                long timeout_ms) override;
};

// "Authorization: Bearer <token>" or nothing when token is empty
std::vector<std::string> bearer_headers(const std::string& token);

// Joins base and path without doubling the slash
std::string join_url(const std::string& base, const std::string& path);

} // namespace stmt
