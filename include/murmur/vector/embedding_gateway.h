#pragma once

#include <murmur/core/types.h>
#include <murmur/ml/provider.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <vector>

namespace murmur::vector {

/**
 * Configuration for the embedding gateway
 */
struct EmbeddingGatewayConfig {
    size_t dimension = 1536;                         // Fixed output dimension D
    size_t batch_size = 64;                          // Texts per provider round-trip
    size_t max_attempts = 5;                         // Attempts per batch, first call included
    std::chrono::milliseconds initial_backoff{200};  // Delay before the first retry
    std::chrono::milliseconds max_backoff{10000};    // Cap for exponential growth
    double jitter = 0.2;                             // +/- fraction applied to every delay
    std::chrono::milliseconds call_timeout{30000};   // Deadline per provider call
    uint64_t jitter_seed = 0;                        // 0 = seed from random_device
};

Result<void> validate(const EmbeddingGatewayConfig& config);

/**
 * Counters for gateway activity; lock-free so pipelines on different owners
 * can update them concurrently.
 */
struct GatewayStats {
    size_t provider_calls = 0;
    size_t retries = 0;
    size_t texts_embedded = 0;
    size_t items_rejected = 0;
    size_t batches_exhausted = 0;
};

/**
 * Uniform call contract over an IEmbeddingProvider.
 *
 * - Input is split into provider batches of at most batch_size texts.
 * - Transient batch failures (timeout, rate limit, network) are retried with
 *   exponential backoff and jitter up to max_attempts; exhaustion fails the
 *   whole call with ProviderUnavailable and returns no vectors at all.
 * - Permanent rejections are isolated to the offending items. A provider that
 *   refuses a batch as a whole with InvalidInput is bisected until the bad
 *   texts are found, so the good ones still get vectors.
 * - A vector of the wrong dimension is reported as that item's
 *   DimensionMismatch, never passed through.
 */
class EmbeddingGateway {
public:
    using SleepFunction = std::function<void(std::chrono::milliseconds)>;

    EmbeddingGateway(std::shared_ptr<ml::IEmbeddingProvider> provider,
                     EmbeddingGatewayConfig config = {});

    EmbeddingGateway(const EmbeddingGateway&) = delete;
    EmbeddingGateway& operator=(const EmbeddingGateway&) = delete;

    /**
     * Embed a batch of texts.
     * @return Per-item outcome in input order, or ProviderUnavailable /
     *         ConfigurationError for the call as a whole
     */
    Result<std::vector<ml::ItemEmbedding>> embed(const std::vector<std::string>& texts);

    /// Single text convenience (query embedding); item errors become call errors.
    Result<std::vector<float>> embedOne(const std::string& text);

    size_t dimension() const { return config_.dimension; }
    const EmbeddingGatewayConfig& config() const { return config_; }

    GatewayStats getStats() const;

    /// Replace the backoff sleep (tests).
    void setSleepFunction(SleepFunction sleeper);

private:
    // Embeds texts[begin, end) into out[begin, end); bisects on InvalidInput.
    Result<void> embedRange(const std::vector<std::string>& texts, size_t begin, size_t end,
                            std::vector<ml::ItemEmbedding>& out);

    // One provider batch with the retry policy applied.
    Result<std::vector<ml::ItemEmbedding>> callWithRetry(const std::vector<std::string>& batch);

    std::chrono::milliseconds backoffFor(size_t attempt);

    std::shared_ptr<ml::IEmbeddingProvider> provider_;
    EmbeddingGatewayConfig config_;
    SleepFunction sleeper_;

    std::mutex rngMutex_;
    std::mt19937_64 rng_;

    std::atomic<size_t> providerCalls_{0};
    std::atomic<size_t> retries_{0};
    std::atomic<size_t> textsEmbedded_{0};
    std::atomic<size_t> itemsRejected_{0};
    std::atomic<size_t> batchesExhausted_{0};
};

} // namespace murmur::vector
