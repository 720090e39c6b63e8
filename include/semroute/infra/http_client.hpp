#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "semroute/core/error.hpp"

namespace semroute::infra {

/// Ordered query parameters; encoded onto the path by the transport.
using QueryParams = std::vector<std::pair<std::string, std::string>>;

struct HttpRequest {
    std::string method = "GET";
    std::string path;
    QueryParams params;
    std::string body;
    std::string content_type = "application/json";
    std::map<std::string, std::string> headers;
};

/// HTTP response from the transport.
struct HttpResponse {
    int status = 0;
    std::map<std::string, std::string> headers;
    std::string body;

    /// Returns true if the status code indicates success (2xx).
    [[nodiscard]] auto is_success() const noexcept -> bool {
        return status >= 200 && status < 300;
    }
};

/// Renders `path?k=v&...` with URL-encoded keys and values.
auto with_query(std::string_view path, const QueryParams& params) -> std::string;

/// One blocking request/response exchange. Transport-level failures
/// (unreachable host, timeout) come back as errors; any HTTP status,
/// including 4xx/5xx, is a successful exchange.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual auto send(const HttpRequest& request) -> Result<HttpResponse> = 0;
};

/// Configuration for the HTTP client.
struct HttpClientConfig {
    std::string base_url;
    int timeout_seconds = 30;
    bool verify_ssl = true;
    std::map<std::string, std::string> default_headers;
};

/// Blocking HTTP client wrapping cpp-httplib.
class HttpClient : public HttpTransport {
public:
    explicit HttpClient(HttpClientConfig config);
    ~HttpClient() override;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;
    HttpClient(HttpClient&&) noexcept;
    HttpClient& operator=(HttpClient&&) noexcept;

    auto send(const HttpRequest& request) -> Result<HttpResponse> override;

    /// Returns the base URL.
    [[nodiscard]] auto base_url() const -> const std::string&;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace semroute::infra
