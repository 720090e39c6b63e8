#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "semroute/core/error.hpp"

namespace semroute::encoders {

/// Produces fixed-width dense vectors for text.
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    /// Embed a single text string into a float vector.
    virtual auto embed(std::string_view text) -> Result<std::vector<float>> = 0;

    /// Embed a batch of text strings, preserving input order.
    virtual auto embed_batch(const std::vector<std::string>& texts)
        -> Result<std::vector<std::vector<float>>> = 0;

    /// Width of the vectors produced; 0 until known.
    [[nodiscard]] virtual auto dimensions() const -> size_t = 0;
};

} // namespace semroute::encoders
