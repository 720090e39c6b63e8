#include "semroute/core/utils.hpp"

#include <algorithm>
#include <iomanip>
#include <memory>
#include <sstream>

#include <openssl/evp.h>

namespace semroute::utils {

auto trim(std::string_view s) -> std::string {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r");
    return std::string(s.substr(start, end - start + 1));
}

auto to_lower(std::string_view s) -> std::string {
    std::string result(s);
    std::ranges::transform(result, result.begin(), ::tolower);
    return result;
}

auto sha256(std::string_view data) -> std::string {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(
        EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr);
    EVP_DigestUpdate(ctx.get(), data.data(), data.size());
    EVP_DigestFinal_ex(ctx.get(), hash, &hash_len);

    std::ostringstream oss;
    for (unsigned int i = 0; i < hash_len; ++i) {
        oss << std::hex << std::setfill('0') << std::setw(2)
            << static_cast<int>(hash[i]);
    }
    return oss.str();
}

auto url_encode(std::string_view s) -> std::string {
    std::ostringstream oss;
    for (char c : s) {
        if (std::isalnum(static_cast<unsigned char>(c)) ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            oss << c;
        } else {
            oss << '%' << std::hex << std::uppercase << std::setfill('0')
                << std::setw(2) << static_cast<int>(static_cast<unsigned char>(c));
        }
    }
    return oss.str();
}

} // namespace semroute::utils
