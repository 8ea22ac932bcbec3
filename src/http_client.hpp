#pragma once

#include <string>
#include <utility>
#include <vector>

namespace stock_sync {

struct HttpRequest {
    enum class Method { Get, Post, Put };

    Method      method = Method::Get;
    std::string url;      // absolute, e.g. "https://shop.myshopify.com/admin/..."
    std::string body;     // sent as application/json when non-empty
    std::vector<std::pair<std::string, std::string>> headers;
    int         timeoutMs = 15000;
};

struct HttpResponse {
    unsigned int httpStatus = 0;
    std::string  body;
    std::string  link;    // raw "Link" header, empty if absent

    bool ok() const { return httpStatus >= 200 && httpStatus < 300; }
};

const char* toString(HttpRequest::Method method);

/// Seam between the sync logic and the network.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /// Perform one request.
    /// @throws std::runtime_error on network / timeout errors. Non-2xx
    ///         statuses are returned, not thrown.
    virtual HttpResponse send(const HttpRequest& request) = 0;
};

/// Synchronous HTTP/1.1 client built on Boost.Beast.
/// One connection per request; HTTPS requires OpenSSL at build time.
class HttpClient : public HttpTransport {
public:
    /// Largest response body accepted (the POS export is one large array).
    static constexpr unsigned long long kMaxBodyBytes = 256ull * 1024 * 1024;

    explicit HttpClient(bool verbose = false) : mVerbose(verbose) {}

    HttpResponse send(const HttpRequest& request) override;

private:
    bool mVerbose;
};

} // namespace stock_sync
