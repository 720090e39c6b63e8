#pragma once

#include <string>
#include <string_view>

namespace semroute::utils {

auto trim(std::string_view s) -> std::string;
auto to_lower(std::string_view s) -> std::string;
auto sha256(std::string_view data) -> std::string;
auto url_encode(std::string_view s) -> std::string;

} // namespace semroute::utils
