#pragma once

#include <deque>
#include <vector>

#include "semroute/core/error.hpp"
#include "semroute/infra/http_client.hpp"

namespace semroute::testing {

/// Replays queued responses in order and records every request.
class ScriptedTransport : public infra::HttpTransport {
public:
    auto send(const infra::HttpRequest& request) -> Result<infra::HttpResponse> override {
        requests.push_back(request);
        if (responses.empty()) {
            return std::unexpected(make_error(ErrorCode::ConnectionFailed,
                                              "HTTP request failed", "no scripted response"));
        }
        auto next = std::move(responses.front());
        responses.pop_front();
        return next;
    }

    void respond(int status, std::string body) {
        responses.push_back(infra::HttpResponse{.status = status, .body = std::move(body)});
    }

    void fail(ErrorCode code) {
        responses.push_back(std::unexpected(make_error(code, "HTTP request failed")));
    }

    std::deque<Result<infra::HttpResponse>> responses;
    std::vector<infra::HttpRequest> requests;
};

} // namespace semroute::testing
