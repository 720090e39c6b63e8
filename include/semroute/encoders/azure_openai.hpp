#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "semroute/core/config.hpp"
#include "semroute/core/error.hpp"
#include "semroute/encoders/embedding_provider.hpp"
#include "semroute/infra/http_client.hpp"

namespace semroute::encoders {

/// Returns a fresh bearer token for the Cognitive Services scope. Supplied by
/// the identity subsystem when managed identity is enabled.
using TokenProvider = std::function<Result<std::string>()>;

enum class AuthMethod {
    ManagedIdentity,
    AdToken,
    ApiKey,
};

auto auth_method_to_string(AuthMethod method) -> std::string_view;

/// Picks the auth strategy in order: managed identity, static Entra ID
/// token, API key. InvalidConfig when none is configured.
auto resolve_auth_method(const EncoderConfig& config) -> Result<AuthMethod>;

/// Azure OpenAI embeddings deployment.
class AzureOpenAIEncoder : public EmbeddingProvider {
public:
    AzureOpenAIEncoder(std::shared_ptr<infra::HttpTransport> transport,
                       EncoderConfig config,
                       AuthMethod auth,
                       TokenProvider token_provider = {});
    ~AzureOpenAIEncoder() override;

    AzureOpenAIEncoder(const AzureOpenAIEncoder&) = delete;
    AzureOpenAIEncoder& operator=(const AzureOpenAIEncoder&) = delete;

    auto embed(std::string_view text) -> Result<std::vector<float>> override;
    auto embed_batch(const std::vector<std::string>& texts)
        -> Result<std::vector<std::vector<float>>> override;
    [[nodiscard]] auto dimensions() const -> size_t override;

    [[nodiscard]] auto auth_method() const noexcept -> AuthMethod;

    /// `/openai/deployments/{deployment}/embeddings`
    [[nodiscard]] auto embeddings_path() const -> std::string;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Builds the encoder from configuration over a real HTTP client.
auto make_encoder(const EncoderConfig& config, TokenProvider token_provider = {})
    -> Result<std::unique_ptr<EmbeddingProvider>>;

} // namespace semroute::encoders
