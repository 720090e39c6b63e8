#include "semroute/infra/http_client.hpp"
#include "semroute/core/logger.hpp"
#include "semroute/core/utils.hpp"

#include <httplib.h>

#include <utility>

namespace semroute::infra {

namespace {

auto to_http_response(const httplib::Result& result)
    -> semroute::Result<HttpResponse> {
    if (!result) {
        auto err = result.error();
        std::string detail;
        switch (err) {
            case httplib::Error::Connection:
                detail = "Connection failed";
                break;
            case httplib::Error::Read:
                detail = "Read error";
                break;
            case httplib::Error::Write:
                detail = "Write error";
                break;
            case httplib::Error::Canceled:
                detail = "Request canceled";
                break;
            case httplib::Error::SSLConnection:
                detail = "SSL connection error";
                break;
            case httplib::Error::SSLServerVerification:
                detail = "SSL server verification failed";
                break;
            case httplib::Error::ConnectionTimeout:
                return std::unexpected(
                    make_error(ErrorCode::Timeout,
                               "HTTP request timed out",
                               "Connection timeout"));
            default:
                detail = "Unknown HTTP error";
                break;
        }
        return std::unexpected(
            make_error(ErrorCode::ConnectionFailed,
                       "HTTP request failed", detail));
    }

    HttpResponse response;
    response.status = result->status;
    response.body = result->body;

    for (const auto& [key, value] : result->headers) {
        response.headers[key] = value;
    }

    return response;
}

auto to_headers(const std::map<std::string, std::string>& map) -> httplib::Headers {
    httplib::Headers hdrs;
    for (const auto& [k, v] : map) {
        hdrs.emplace(k, v);
    }
    return hdrs;
}

} // anonymous namespace

auto with_query(std::string_view path, const QueryParams& params) -> std::string {
    std::string out(path);
    char sep = '?';
    for (const auto& [key, value] : params) {
        out += sep;
        out += utils::url_encode(key);
        out += '=';
        out += utils::url_encode(value);
        sep = '&';
    }
    return out;
}

struct HttpClient::Impl {
    HttpClientConfig config;
    std::unique_ptr<httplib::Client> client;
    // httplib::Client is not safe for concurrent use.
    std::mutex mtx;

    explicit Impl(HttpClientConfig config_)
        : config(std::move(config_)) {
        client = std::make_unique<httplib::Client>(config.base_url);
        client->set_connection_timeout(config.timeout_seconds);
        client->set_read_timeout(config.timeout_seconds);
        client->set_write_timeout(config.timeout_seconds);
        client->set_keep_alive(true);

        if (!config.verify_ssl) {
            client->enable_server_certificate_verification(false);
        }

        client->set_default_headers(to_headers(config.default_headers));

        LOG_DEBUG("HTTP client created for {}", config.base_url);
    }
};

HttpClient::HttpClient(HttpClientConfig config)
    : impl_(std::make_unique<Impl>(std::move(config))) {}

HttpClient::~HttpClient() = default;

HttpClient::HttpClient(HttpClient&&) noexcept = default;
HttpClient& HttpClient::operator=(HttpClient&&) noexcept = default;

auto HttpClient::send(const HttpRequest& request) -> Result<HttpResponse> {
    auto target = with_query(request.path, request.params);
    LOG_DEBUG("{} {}{}", request.method, impl_->config.base_url, target);

    std::lock_guard lock(impl_->mtx);
    auto& client = *impl_->client;
    const auto hdrs = to_headers(request.headers);

    if (request.method == "GET") {
        return to_http_response(client.Get(target, hdrs));
    }
    if (request.method == "POST") {
        return to_http_response(
            client.Post(target, hdrs, request.body, request.content_type));
    }
    if (request.method == "PUT") {
        return to_http_response(
            client.Put(target, hdrs, request.body, request.content_type));
    }
    if (request.method == "PATCH") {
        return to_http_response(
            client.Patch(target, hdrs, request.body, request.content_type));
    }
    if (request.method == "DELETE") {
        return to_http_response(client.Delete(target, hdrs));
    }

    return std::unexpected(
        make_error(ErrorCode::InvalidArgument,
                   "Unsupported HTTP method", request.method));
}

auto HttpClient::base_url() const -> const std::string& {
    return impl_->config.base_url;
}

} // namespace semroute::infra
