#pragma once

#include <murmur/core/types.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace murmur::ml {

/**
 * Per-item outcome of a provider call: the vector, or an InvalidInput error
 * when the provider rejected just that text.
 */
using ItemEmbedding = Result<std::vector<float>>;

/**
 * Abstract interface for the remote embedding model.
 *
 * Implementations must be safe to call from several threads at once.
 * Batch-level failures use the transient codes (ProviderUnavailable,
 * Timeout, NetworkError, ResourceExhausted for rate limits) or InvalidInput
 * when the provider refuses the batch as a whole because of malformed input.
 */
class IEmbeddingProvider {
public:
    virtual ~IEmbeddingProvider() = default;

    /**
     * One entry per input text, in input order, or a batch-level error.
     * `timeout` bounds the whole call; exceeding it is ErrorCode::Timeout.
     */
    virtual Result<std::vector<ItemEmbedding>>
    generateBatchEmbeddings(const std::vector<std::string>& texts,
                            std::chrono::milliseconds timeout) = 0;

    /// Name for logs, e.g. "Mock" or "OpenAI".
    virtual std::string getProviderName() const = 0;

    virtual size_t getEmbeddingDimension() const = 0;
};

/**
 * Deterministic provider for tests and local development: the vector is a
 * unit-normalized pseudo-random projection seeded by the text.
 */
std::unique_ptr<IEmbeddingProvider> createMockEmbeddingProvider(size_t dimension);

} // namespace murmur::ml
