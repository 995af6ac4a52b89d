#include <murmur/ml/provider.h>

#include <spdlog/spdlog.h>

#include <cmath>
#include <cstdint>
#include <string_view>

namespace murmur::ml {

namespace {

// FNV-1a; stable across platforms, unlike std::hash.
uint64_t fingerprint(std::string_view text) {
    uint64_t h = 1469598103934665603ull;
    for (unsigned char c : text) {
        h ^= c;
        h *= 1099511628211ull;
    }
    return h;
}

class MockEmbeddingProvider final : public IEmbeddingProvider {
public:
    explicit MockEmbeddingProvider(size_t dimension) : dimension_(dimension) {
        spdlog::debug("[MockEmbeddingProvider] dimension {}", dimension);
    }

    Result<std::vector<ItemEmbedding>>
    generateBatchEmbeddings(const std::vector<std::string>& texts,
                            std::chrono::milliseconds) override {
        std::vector<ItemEmbedding> out;
        out.reserve(texts.size());
        for (const auto& text : texts) {
            if (text.empty()) {
                out.emplace_back(Error{ErrorCode::InvalidInput, "Empty input text"});
            } else {
                out.emplace_back(project(text));
            }
        }
        return out;
    }

    std::string getProviderName() const override { return "Mock"; }
    size_t getEmbeddingDimension() const override { return dimension_; }

private:
    // xorshift stream seeded by the text, mapped to [-1, 1], then normalized.
    std::vector<float> project(const std::string& text) const {
        uint64_t state = fingerprint(text) | 1;
        std::vector<float> v(dimension_);
        double norm = 0.0;
        for (auto& x : v) {
            state ^= state << 13;
            state ^= state >> 7;
            state ^= state << 17;
            x = static_cast<float>(static_cast<double>(state >> 11) * 0x1.0p-53 * 2.0 - 1.0);
            norm += static_cast<double>(x) * x;
        }
        if (norm > 0.0) {
            const auto scale = static_cast<float>(1.0 / std::sqrt(norm));
            for (auto& x : v) {
                x *= scale;
            }
        }
        return v;
    }

    size_t dimension_;
};

} // namespace

std::unique_ptr<IEmbeddingProvider> createMockEmbeddingProvider(size_t dimension) {
    return std::make_unique<MockEmbeddingProvider>(dimension);
}

} // namespace murmur::ml
