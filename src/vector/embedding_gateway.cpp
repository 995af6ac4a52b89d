#include <murmur/vector/embedding_gateway.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <thread>

namespace murmur::vector {

Result<void> validate(const EmbeddingGatewayConfig& config) {
    if (config.dimension == 0) {
        return Error{ErrorCode::ConfigurationError, "Embedding dimension must be positive"};
    }
    if (config.batch_size == 0) {
        return Error{ErrorCode::ConfigurationError, "Embedding batch_size must be positive"};
    }
    if (config.max_attempts == 0) {
        return Error{ErrorCode::ConfigurationError, "Embedding max_attempts must be at least 1"};
    }
    if (config.jitter < 0.0 || config.jitter > 1.0) {
        return Error{ErrorCode::ConfigurationError, "Embedding jitter must be within [0, 1]"};
    }
    if (config.initial_backoff > config.max_backoff) {
        return Error{ErrorCode::ConfigurationError, "initial_backoff exceeds max_backoff"};
    }
    if (config.call_timeout.count() <= 0) {
        return Error{ErrorCode::ConfigurationError, "Embedding call_timeout must be positive"};
    }
    return {};
}

EmbeddingGateway::EmbeddingGateway(std::shared_ptr<ml::IEmbeddingProvider> provider,
                                   EmbeddingGatewayConfig config)
    : provider_(std::move(provider)), config_(config),
      sleeper_([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }),
      rng_(config.jitter_seed != 0 ? config.jitter_seed : std::random_device{}()) {}

void EmbeddingGateway::setSleepFunction(SleepFunction sleeper) {
    sleeper_ = std::move(sleeper);
}

GatewayStats EmbeddingGateway::getStats() const {
    GatewayStats stats;
    stats.provider_calls = providerCalls_.load();
    stats.retries = retries_.load();
    stats.texts_embedded = textsEmbedded_.load();
    stats.items_rejected = itemsRejected_.load();
    stats.batches_exhausted = batchesExhausted_.load();
    return stats;
}

Result<std::vector<ml::ItemEmbedding>>
EmbeddingGateway::embed(const std::vector<std::string>& texts) {
    if (auto valid = validate(config_); !valid) {
        return valid.error();
    }
    if (!provider_) {
        return Error{ErrorCode::NotInitialized, "No embedding provider configured"};
    }

    std::vector<ml::ItemEmbedding> out;
    out.reserve(texts.size());
    for (size_t i = 0; i < texts.size(); ++i) {
        out.emplace_back(Error{ErrorCode::InternalError, "Not embedded"});
    }

    for (size_t begin = 0; begin < texts.size(); begin += config_.batch_size) {
        size_t end = std::min(begin + config_.batch_size, texts.size());
        auto result = embedRange(texts, begin, end, out);
        if (!result) {
            return result.error();
        }
    }

    return out;
}

Result<std::vector<float>> EmbeddingGateway::embedOne(const std::string& text) {
    auto result = embed({text});
    if (!result) {
        return result.error();
    }
    auto items = std::move(result).value();
    if (items.empty()) {
        return Error{ErrorCode::InternalError, "Provider returned no embedding"};
    }
    if (!items.front()) {
        return items.front().error();
    }
    return std::move(items.front()).value();
}

Result<void> EmbeddingGateway::embedRange(const std::vector<std::string>& texts, size_t begin,
                                          size_t end, std::vector<ml::ItemEmbedding>& out) {
    std::vector<std::string> batch(texts.begin() + static_cast<std::ptrdiff_t>(begin),
                                   texts.begin() + static_cast<std::ptrdiff_t>(end));

    auto result = callWithRetry(batch);
    if (!result) {
        if (result.error().code != ErrorCode::InvalidInput) {
            return result.error();
        }

        if (end - begin == 1) {
            spdlog::warn("[EmbeddingGateway] Provider rejected item {}: {}", begin,
                         result.error().message);
            itemsRejected_++;
            out[begin] = result.error();
            return {};
        }

        // Whole-batch rejection: bisect to isolate the offending texts.
        size_t mid = begin + (end - begin) / 2;
        spdlog::debug("[EmbeddingGateway] Batch [{}, {}) rejected, bisecting at {}", begin, end,
                      mid);
        auto left = embedRange(texts, begin, mid, out);
        if (!left) {
            return left;
        }
        return embedRange(texts, mid, end, out);
    }

    auto items = std::move(result).value();
    for (size_t i = 0; i < items.size(); ++i) {
        auto& item = items[i];
        if (!item) {
            spdlog::warn("[EmbeddingGateway] Provider rejected item {}: {}", begin + i,
                         item.error().message);
            itemsRejected_++;
            out[begin + i] = item.error();
        } else if (item.value().size() != config_.dimension) {
            spdlog::warn("[EmbeddingGateway] Item {} has dimension {}, expected {}", begin + i,
                         item.value().size(), config_.dimension);
            itemsRejected_++;
            out[begin + i] = Error{ErrorCode::DimensionMismatch,
                                   "Provider returned dimension " +
                                       std::to_string(item.value().size()) + ", expected " +
                                       std::to_string(config_.dimension)};
        } else {
            textsEmbedded_++;
            out[begin + i] = std::move(item);
        }
    }
    return {};
}

Result<std::vector<ml::ItemEmbedding>>
EmbeddingGateway::callWithRetry(const std::vector<std::string>& batch) {
    Error lastError{ErrorCode::ProviderUnavailable, "No attempt made"};

    for (size_t attempt = 0; attempt < config_.max_attempts; ++attempt) {
        providerCalls_++;

        Result<std::vector<ml::ItemEmbedding>> result{
            Error{ErrorCode::ProviderUnavailable, "No response"}};
        try {
            result = provider_->generateBatchEmbeddings(batch, config_.call_timeout);
        } catch (const std::exception& e) {
            result = Error{ErrorCode::ProviderUnavailable,
                           std::string("Provider threw: ") + e.what()};
        }

        if (result) {
            if (result.value().size() == batch.size()) {
                return result;
            }
            lastError = Error{ErrorCode::ProviderUnavailable,
                              "Provider returned " + std::to_string(result.value().size()) +
                                  " embeddings for " + std::to_string(batch.size()) + " texts"};
        } else {
            const auto& error = result.error();
            if (error.code == ErrorCode::InvalidInput) {
                return error;
            }
            if (!isTransient(error.code)) {
                spdlog::error("[EmbeddingGateway] Provider '{}' failed permanently: {} ({})",
                              provider_->getProviderName(), error.message,
                              errorToString(error.code));
                return Error{ErrorCode::ProviderUnavailable, error.message};
            }
            lastError = error;
        }

        if (attempt + 1 < config_.max_attempts) {
            auto delay = backoffFor(attempt);
            retries_++;
            spdlog::warn("[EmbeddingGateway] Attempt {}/{} failed ({}), retrying in {}ms",
                         attempt + 1, config_.max_attempts, lastError.message, delay.count());
            sleeper_(delay);
        }
    }

    batchesExhausted_++;
    spdlog::error("[EmbeddingGateway] Giving up on batch of {} after {} attempts: {}",
                  batch.size(), config_.max_attempts, lastError.message);
    return Error{ErrorCode::ProviderUnavailable,
                 "Embedding provider unavailable after " + std::to_string(config_.max_attempts) +
                     " attempts: " + lastError.message};
}

std::chrono::milliseconds EmbeddingGateway::backoffFor(size_t attempt) {
    double base = static_cast<double>(config_.initial_backoff.count()) *
                  std::pow(2.0, static_cast<double>(attempt));
    base = std::min(base, static_cast<double>(config_.max_backoff.count()));

    double factor = 1.0;
    if (config_.jitter > 0.0) {
        std::lock_guard<std::mutex> lock(rngMutex_);
        std::uniform_real_distribution<double> dist(1.0 - config_.jitter, 1.0 + config_.jitter);
        factor = dist(rng_);
    }

    double delay = std::min(base * factor, static_cast<double>(config_.max_backoff.count()));
    return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(delay));
}

} // namespace murmur::vector
