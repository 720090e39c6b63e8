#include <catch2/catch_test_macros.hpp>

#include "semroute/core/error.hpp"

TEST_CASE("Error creation and accessors", "[error]") {
    SECTION("basic error") {
        semroute::Error err(semroute::ErrorCode::NotFound, "collection not found");
        CHECK(err.code() == semroute::ErrorCode::NotFound);
        CHECK(err.message() == "collection not found");
        CHECK(err.detail() == "");
        CHECK(err.what() == "collection not found");
    }

    SECTION("error with detail") {
        semroute::Error err(semroute::ErrorCode::BackendError,
                            "Import documents failed", "HTTP 503");
        CHECK(err.code() == semroute::ErrorCode::BackendError);
        CHECK(err.detail() == "HTTP 503");
        CHECK(err.what() == "Import documents failed: HTTP 503");
    }
}

TEST_CASE("is_not_found only matches NotFound", "[error]") {
    CHECK(semroute::is_not_found(semroute::make_error(semroute::ErrorCode::NotFound, "x")));
    CHECK_FALSE(semroute::is_not_found(
        semroute::make_error(semroute::ErrorCode::AlreadyExists, "x")));
    CHECK_FALSE(semroute::is_not_found(
        semroute::make_error(semroute::ErrorCode::ConnectionFailed, "x")));
}

TEST_CASE("Result type error case", "[error]") {
    semroute::Result<int> result = std::unexpected(
        semroute::make_error(semroute::ErrorCode::MalformedPayload, "bad payload"));

    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == semroute::ErrorCode::MalformedPayload);
    CHECK(result.error().message() == "bad payload");
}

TEST_CASE("error_code_to_string names", "[error]") {
    using semroute::ErrorCode;
    CHECK(semroute::error_code_to_string(ErrorCode::NotFound) == "NOT_FOUND");
    CHECK(semroute::error_code_to_string(ErrorCode::AlreadyExists) == "ALREADY_EXISTS");
    CHECK(semroute::error_code_to_string(ErrorCode::MalformedPayload) == "MALFORMED_PAYLOAD");
    CHECK(semroute::error_code_to_string(ErrorCode::BackendError) == "BACKEND_ERROR");
    CHECK(semroute::error_code_to_string(ErrorCode::Timeout) == "TIMEOUT");
}
