#include "semroute/encoders/azure_openai.hpp"
#include "semroute/core/logger.hpp"
#include "semroute/core/utils.hpp"

#include <algorithm>

#include <nlohmann/json.hpp>

namespace semroute::encoders {

using json = nlohmann::json;

namespace {

// Hard-cap input to ~8000 tokens (32000 chars)
constexpr size_t kMaxEmbedChars = 32000;

auto known_dimensions(std::string_view deployment) -> size_t {
    if (deployment == "text-embedding-3-large") return 3072;
    if (deployment == "text-embedding-3-small") return 1536;
    if (deployment == "text-embedding-ada-002") return 1536;
    return 0;
}

auto deployment_path(std::string_view deployment) -> std::string {
    return "/openai/deployments/" + utils::url_encode(deployment) + "/embeddings";
}

auto to_vector(const json& embedding_data) -> std::vector<float> {
    std::vector<float> embedding;
    embedding.reserve(embedding_data.size());
    for (const auto& val : embedding_data) {
        embedding.push_back(val.get<float>());
    }
    return embedding;
}

} // anonymous namespace

auto auth_method_to_string(AuthMethod method) -> std::string_view {
    switch (method) {
        case AuthMethod::ManagedIdentity: return "managed_identity";
        case AuthMethod::AdToken: return "ad_token";
        case AuthMethod::ApiKey: return "api_key";
    }
    return "unknown";
}

auto resolve_auth_method(const EncoderConfig& config) -> Result<AuthMethod> {
    if (config.use_managed_identity) {
        return AuthMethod::ManagedIdentity;
    }
    if (config.ad_token && !config.ad_token->empty()) {
        return AuthMethod::AdToken;
    }
    if (config.api_key && !config.api_key->empty()) {
        return AuthMethod::ApiKey;
    }
    return std::unexpected(
        make_error(ErrorCode::InvalidConfig,
                   "No Azure OpenAI auth configured",
                   "set one of AZURE_USE_MANAGED_IDENTITY=true, AZURE_AD_TOKEN, "
                   "or AZURE_OPENAI_API_KEY"));
}

// ---------------------------------------------------------------------------
// AzureOpenAIEncoder::Impl
// ---------------------------------------------------------------------------

struct AzureOpenAIEncoder::Impl {
    std::shared_ptr<infra::HttpTransport> http;
    EncoderConfig config;
    AuthMethod auth;
    TokenProvider token_provider;
    size_t dims = 0;

    auto auth_headers() -> Result<std::map<std::string, std::string>> {
        switch (auth) {
            case AuthMethod::ManagedIdentity: {
                if (!token_provider) {
                    return std::unexpected(
                        make_error(ErrorCode::InvalidConfig,
                                   "Managed identity enabled without a token provider"));
                }
                auto token = token_provider();
                if (!token) {
                    return std::unexpected(
                        make_error(ErrorCode::Unauthorized,
                                   "Failed to acquire Entra ID token",
                                   token.error().what()));
                }
                return std::map<std::string, std::string>{
                    {"Authorization", "Bearer " + *token}};
            }
            case AuthMethod::AdToken:
                return std::map<std::string, std::string>{
                    {"Authorization", "Bearer " + config.ad_token.value_or("")}};
            case AuthMethod::ApiKey:
                return std::map<std::string, std::string>{
                    {"api-key", config.api_key.value_or("")}};
        }
        return std::map<std::string, std::string>{};
    }

    auto post_embeddings(const json& input) -> Result<json> {
        auto headers = auth_headers();
        if (!headers) {
            return std::unexpected(headers.error());
        }

        json request_body = {{"input", input}};
        auto response = http->send({
            .method = "POST",
            .path = deployment_path(config.deployment),
            .params = {{"api-version", config.api_version}},
            .body = request_body.dump(),
            .headers = std::move(*headers),
        });

        if (!response) {
            return std::unexpected(
                make_error(ErrorCode::ProviderError,
                           "Embedding request failed",
                           response.error().what()));
        }

        if (!response->is_success()) {
            LOG_ERROR("Azure OpenAI embeddings API returned status {}: {}",
                      response->status, response->body);
            return std::unexpected(
                make_error(response->status == 401 || response->status == 403
                               ? ErrorCode::Unauthorized
                               : ErrorCode::ProviderError,
                           "Embedding API error",
                           "HTTP " + std::to_string(response->status) + ": " +
                               response->body));
        }

        try {
            auto body = json::parse(response->body);
            if (!body.contains("data") || !body["data"].is_array()) {
                return std::unexpected(
                    make_error(ErrorCode::ProviderError,
                               "Embedding response missing data"));
            }
            return body;
        } catch (const json::exception& e) {
            return std::unexpected(
                make_error(ErrorCode::SerializationError,
                           "Failed to parse embedding response",
                           e.what()));
        }
    }
};

// ---------------------------------------------------------------------------
// AzureOpenAIEncoder
// ---------------------------------------------------------------------------

AzureOpenAIEncoder::AzureOpenAIEncoder(std::shared_ptr<infra::HttpTransport> transport,
                                       EncoderConfig config,
                                       AuthMethod auth,
                                       TokenProvider token_provider)
    : impl_(std::make_unique<Impl>()) {
    impl_->http = std::move(transport);
    impl_->dims = known_dimensions(config.deployment);
    impl_->config = std::move(config);
    impl_->auth = auth;
    impl_->token_provider = std::move(token_provider);
    LOG_INFO("Azure OpenAI encoder for deployment '{}' using {} auth",
             impl_->config.deployment, auth_method_to_string(auth));
}

AzureOpenAIEncoder::~AzureOpenAIEncoder() = default;

auto AzureOpenAIEncoder::embed(std::string_view text) -> Result<std::vector<float>> {
    std::string input_text(text.substr(0, std::min(text.size(), kMaxEmbedChars)));

    auto body = impl_->post_embeddings(json(input_text));
    if (!body) {
        return std::unexpected(body.error());
    }
    if ((*body)["data"].empty()) {
        return std::unexpected(
            make_error(ErrorCode::ProviderError, "Embedding response missing data"));
    }

    try {
        auto embedding = to_vector((*body)["data"][0].at("embedding"));
        impl_->dims = embedding.size();
        LOG_DEBUG("Generated embedding with {} dimensions", embedding.size());
        return embedding;
    } catch (const json::exception& e) {
        return std::unexpected(
            make_error(ErrorCode::SerializationError,
                       "Failed to parse embedding response", e.what()));
    }
}

auto AzureOpenAIEncoder::embed_batch(const std::vector<std::string>& texts)
    -> Result<std::vector<std::vector<float>>> {
    if (texts.empty()) {
        return std::vector<std::vector<float>>{};
    }

    std::vector<std::string> capped_texts;
    capped_texts.reserve(texts.size());
    for (const auto& t : texts) {
        capped_texts.push_back(t.size() > kMaxEmbedChars ? t.substr(0, kMaxEmbedChars) : t);
    }

    auto body = impl_->post_embeddings(json(capped_texts));
    if (!body) {
        return std::unexpected(body.error());
    }

    try {
        // Results carry their input index and may arrive out of order.
        std::vector<std::vector<float>> results(texts.size());
        for (const auto& item : (*body)["data"]) {
            auto index = item.at("index").get<size_t>();
            if (index >= results.size()) {
                continue;
            }
            results[index] = to_vector(item.at("embedding"));
        }

        for (size_t i = 0; i < results.size(); ++i) {
            if (results[i].empty()) {
                return std::unexpected(
                    make_error(ErrorCode::ProviderError,
                               "Batch embedding response missing entry",
                               "index " + std::to_string(i)));
            }
        }

        impl_->dims = results.front().size();
        LOG_DEBUG("Generated {} embeddings in batch", results.size());
        return results;
    } catch (const json::exception& e) {
        return std::unexpected(
            make_error(ErrorCode::SerializationError,
                       "Failed to parse batch embedding response", e.what()));
    }
}

auto AzureOpenAIEncoder::dimensions() const -> size_t {
    return impl_->dims;
}

auto AzureOpenAIEncoder::auth_method() const noexcept -> AuthMethod {
    return impl_->auth;
}

auto AzureOpenAIEncoder::embeddings_path() const -> std::string {
    return deployment_path(impl_->config.deployment);
}

auto make_encoder(const EncoderConfig& config, TokenProvider token_provider)
    -> Result<std::unique_ptr<EmbeddingProvider>> {
    if (config.endpoint.empty()) {
        return std::unexpected(
            make_error(ErrorCode::InvalidConfig, "AZURE_OPENAI_ENDPOINT is required"));
    }

    auto auth = resolve_auth_method(config);
    if (!auth) {
        return std::unexpected(auth.error());
    }

    auto transport = std::make_shared<infra::HttpClient>(infra::HttpClientConfig{
        .base_url = config.endpoint,
        .timeout_seconds = config.timeout_seconds,
        .verify_ssl = true,
    });

    return std::make_unique<AzureOpenAIEncoder>(
        std::move(transport), config, *auth, std::move(token_provider));
}

} // namespace semroute::encoders
