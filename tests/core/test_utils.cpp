#include <catch2/catch_test_macros.hpp>

#include <string>

#include "semroute/core/utils.hpp"

using namespace semroute::utils;

TEST_CASE("sha256 produces known digests", "[utils]") {
    CHECK(sha256("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    CHECK(sha256("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("url_encode escapes reserved characters", "[utils]") {
    CHECK(url_encode("abc-_.~") == "abc-_.~");
    CHECK(url_encode("a b") == "a%20b");
    CHECK(url_encode("sr_route:=`x`") == "sr_route%3A%3D%60x%60");
}

TEST_CASE("trim and to_lower", "[utils]") {
    CHECK(trim("  value \n") == "value");
    CHECK(trim("   ").empty());
    CHECK(to_lower("TRUE") == "true");
}
