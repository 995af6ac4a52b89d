#include <murmur/vector/vector_index.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <numeric>
#include <optional>
#include <random>
#include <unordered_map>

namespace murmur::vector {

const char* indexTypeName(IndexType type) {
    switch (type) {
        case IndexType::FLAT: return "flat";
        case IndexType::IVF_FLAT: return "ivf_flat";
    }
    return "unknown";
}

Result<void> validate(const IndexConfig& config) {
    if (config.dimension == 0) {
        return Error{ErrorCode::ConfigurationError, "Index dimension must be positive"};
    }
    if (config.ivf_nlist == 0) {
        return Error{ErrorCode::ConfigurationError, "ivf_nlist must be positive"};
    }
    if (config.ivf_nprobe == 0 || config.ivf_nprobe > config.ivf_nlist) {
        return Error{ErrorCode::ConfigurationError, "ivf_nprobe must be within [1, ivf_nlist]"};
    }
    if (config.kmeans_iterations == 0) {
        return Error{ErrorCode::ConfigurationError, "kmeans_iterations must be positive"};
    }
    return {};
}

namespace {

Error dimensionMismatch(size_t got, size_t expected) {
    return Error{ErrorCode::DimensionMismatch, "Vector dimension " + std::to_string(got) +
                                                   " does not match index dimension " +
                                                   std::to_string(expected)};
}

// Clamp away rounding drift so reported similarities stay within [-1, 1].
float clampSimilarity(float s) {
    return std::max(-1.0f, std::min(1.0f, s));
}

// Scores within kSimilarityEpsilon of 1 are reported as exactly 1, so a stored
// vector queried with itself meets a threshold of 1.0.
float similarityScore(float dot) {
    const float s = clampSimilarity(dot);
    return s >= 1.0f - kSimilarityEpsilon ? 1.0f : s;
}

std::vector<SearchResult> topK(std::vector<SearchResult> candidates, size_t k) {
    size_t result_size = std::min(k, candidates.size());
    std::partial_sort(candidates.begin(),
                      candidates.begin() + static_cast<std::ptrdiff_t>(result_size),
                      candidates.end(), vector_utils::rankBefore);
    candidates.resize(result_size);
    return candidates;
}

// Dense slot storage shared by both strategies; removal swaps the last slot in.
class SlotStore {
public:
    size_t size() const { return ids_.size(); }

    bool contains(const std::string& id) const { return idToSlot_.count(id) > 0; }

    std::optional<size_t> find(const std::string& id) const {
        auto it = idToSlot_.find(id);
        if (it == idToSlot_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    size_t append(const std::string& id, std::vector<float> vector) {
        size_t slot = ids_.size();
        ids_.push_back(id);
        vectors_.push_back(std::move(vector));
        idToSlot_[id] = slot;
        return slot;
    }

    // Returns the slot that moved into `slot`'s place, if any.
    std::optional<size_t> erase(size_t slot) {
        size_t last = ids_.size() - 1;
        idToSlot_.erase(ids_[slot]);
        if (slot == last) {
            ids_.pop_back();
            vectors_.pop_back();
            return std::nullopt;
        }
        ids_[slot] = std::move(ids_[last]);
        vectors_[slot] = std::move(vectors_[last]);
        ids_.pop_back();
        vectors_.pop_back();
        idToSlot_[ids_[slot]] = slot;
        return last;
    }

    const std::string& id(size_t slot) const { return ids_[slot]; }
    const std::vector<float>& vector(size_t slot) const { return vectors_[slot]; }
    std::vector<float>& vector(size_t slot) { return vectors_[slot]; }

    std::vector<std::pair<std::string, std::vector<float>>> entries() const {
        std::vector<std::pair<std::string, std::vector<float>>> out;
        out.reserve(ids_.size());
        for (size_t i = 0; i < ids_.size(); ++i) {
            out.emplace_back(ids_[i], vectors_[i]);
        }
        return out;
    }

private:
    std::vector<std::string> ids_;
    std::vector<std::vector<float>> vectors_;
    std::unordered_map<std::string, size_t> idToSlot_;
};

} // namespace

// =============================================================================
// Flat Index Implementation (Brute Force)
// =============================================================================

class FlatIndex : public VectorIndex {
public:
    explicit FlatIndex(const IndexConfig& config) : VectorIndex(config) {}

    Result<void> upsert(const std::string& id, const std::vector<float>& vector) override {
        if (vector.size() != config_.dimension) {
            return dimensionMismatch(vector.size(), config_.dimension);
        }

        auto normalized = vector_utils::normalize(vector);
        if (auto slot = store_.find(id)) {
            store_.vector(*slot) = std::move(normalized);
        } else {
            store_.append(id, std::move(normalized));
        }
        return {};
    }

    bool remove(const std::string& id) override {
        auto slot = store_.find(id);
        if (!slot) {
            return false;
        }
        store_.erase(*slot);
        return true;
    }

    Result<std::vector<SearchResult>> search(const std::vector<float>& query, size_t k,
                                             float threshold) const override {
        if (query.size() != config_.dimension) {
            return dimensionMismatch(query.size(), config_.dimension);
        }
        if (k == 0 || store_.size() == 0) {
            return std::vector<SearchResult>{};
        }

        auto normalized_query = vector_utils::normalize(query);

        std::vector<SearchResult> candidates;
        candidates.reserve(store_.size());
        for (size_t i = 0; i < store_.size(); ++i) {
            const float sim =
                similarityScore(vector_utils::dot(normalized_query, store_.vector(i)));
            if (sim >= threshold) {
                candidates.emplace_back(store_.id(i), sim);
            }
        }

        return topK(std::move(candidates), k);
    }

    bool contains(const std::string& id) const override { return store_.contains(id); }
    size_t size() const override { return store_.size(); }
    IndexType type() const override { return IndexType::FLAT; }

    std::vector<std::pair<std::string, std::vector<float>>> entries() const override {
        return store_.entries();
    }

private:
    SlotStore store_;
};

// =============================================================================
// IVF Flat Index Implementation
// =============================================================================

class IvfFlatIndex : public VectorIndex {
public:
    explicit IvfFlatIndex(const IndexConfig& config) : VectorIndex(config) {}

    Result<void> upsert(const std::string& id, const std::vector<float>& vector) override {
        if (vector.size() != config_.dimension) {
            return dimensionMismatch(vector.size(), config_.dimension);
        }

        auto normalized = vector_utils::normalize(vector);
        if (auto slot = store_.find(id)) {
            if (trained_) {
                detachFromList(*slot);
            }
            store_.vector(*slot) = std::move(normalized);
            if (trained_) {
                attachToList(*slot);
            }
        } else {
            const size_t newSlot = store_.append(id, std::move(normalized));
            slotList_.push_back(0);
            if (trained_) {
                attachToList(newSlot);
            }
        }

        if (!trained_ && !deferTraining_ && store_.size() >= config_.ivf_nlist) {
            train();
        }
        return {};
    }

    bool remove(const std::string& id) override {
        auto slot = store_.find(id);
        if (!slot) {
            return false;
        }

        if (trained_) {
            detachFromList(*slot);
        }
        auto moved = store_.erase(*slot);
        if (moved) {
            // The former last slot now lives at *slot.
            slotList_[*slot] = slotList_[*moved];
            if (trained_) {
                auto& list = lists_[slotList_[*slot]];
                std::replace(list.begin(), list.end(), *moved, *slot);
            }
        }
        slotList_.pop_back();
        return true;
    }

    Result<std::vector<SearchResult>> search(const std::vector<float>& query, size_t k,
                                             float threshold) const override {
        if (query.size() != config_.dimension) {
            return dimensionMismatch(query.size(), config_.dimension);
        }
        if (k == 0 || store_.size() == 0) {
            return std::vector<SearchResult>{};
        }

        auto normalized_query = vector_utils::normalize(query);
        std::vector<SearchResult> candidates;

        auto consider = [&](size_t slot) {
            const float sim =
                similarityScore(vector_utils::dot(normalized_query, store_.vector(slot)));
            if (sim >= threshold) {
                candidates.emplace_back(store_.id(slot), sim);
            }
        };

        if (!trained_) {
            for (size_t i = 0; i < store_.size(); ++i) {
                consider(i);
            }
            return topK(std::move(candidates), k);
        }

        // Probe the nprobe closest lists; ties resolved by list index.
        std::vector<std::pair<float, size_t>> centroidScores;
        centroidScores.reserve(centroids_.size());
        for (size_t c = 0; c < centroids_.size(); ++c) {
            centroidScores.emplace_back(vector_utils::dot(normalized_query, centroids_[c]), c);
        }
        size_t nprobe = std::min(config_.ivf_nprobe, centroidScores.size());
        std::partial_sort(centroidScores.begin(),
                          centroidScores.begin() + static_cast<std::ptrdiff_t>(nprobe),
                          centroidScores.end(), [](const auto& a, const auto& b) {
                              if (a.first != b.first) {
                                  return a.first > b.first;
                              }
                              return a.second < b.second;
                          });

        for (size_t p = 0; p < nprobe; ++p) {
            for (size_t slot : lists_[centroidScores[p].second]) {
                consider(slot);
            }
        }

        return topK(std::move(candidates), k);
    }

    bool contains(const std::string& id) const override { return store_.contains(id); }
    size_t size() const override { return store_.size(); }
    IndexType type() const override { return IndexType::IVF_FLAT; }

    std::vector<std::pair<std::string, std::vector<float>>> entries() const override {
        return store_.entries();
    }

    void setDeferTraining(bool defer) { deferTraining_ = defer; }

    // Spherical k-means over the current contents, then rebuild the lists.
    void train() {
        const size_t n = store_.size();
        if (n == 0) {
            return;
        }
        const size_t nlist = std::min(config_.ivf_nlist, n);
        const size_t dim = config_.dimension;

        std::vector<size_t> order(n);
        std::iota(order.begin(), order.end(), 0);
        std::mt19937_64 rng(config_.seed);
        std::shuffle(order.begin(), order.end(), rng);

        centroids_.clear();
        for (size_t c = 0; c < nlist; ++c) {
            centroids_.push_back(store_.vector(order[c]));
        }

        std::vector<size_t> assignment(n, 0);
        for (size_t iter = 0; iter < config_.kmeans_iterations; ++iter) {
            bool changed = false;
            for (size_t i = 0; i < n; ++i) {
                size_t best = nearestCentroid(store_.vector(i));
                if (best != assignment[i]) {
                    changed = true;
                    assignment[i] = best;
                }
            }

            std::vector<std::vector<float>> sums(nlist, std::vector<float>(dim, 0.0f));
            std::vector<size_t> counts(nlist, 0);
            for (size_t i = 0; i < n; ++i) {
                const auto& v = store_.vector(i);
                auto& sum = sums[assignment[i]];
                for (size_t d = 0; d < dim; ++d) {
                    sum[d] += v[d];
                }
                counts[assignment[i]]++;
            }
            for (size_t c = 0; c < nlist; ++c) {
                // Empty clusters keep their previous centroid.
                if (counts[c] > 0) {
                    centroids_[c] = vector_utils::normalize(sums[c]);
                }
            }

            if (!changed && iter > 0) {
                break;
            }
        }

        lists_.assign(nlist, {});
        slotList_.assign(n, 0);
        for (size_t i = 0; i < n; ++i) {
            attachToList(i);
        }
        trained_ = true;

        spdlog::debug("[IvfFlatIndex] Trained {} lists over {} vectors", nlist, n);
    }

private:
    size_t nearestCentroid(const std::vector<float>& v) const {
        size_t best = 0;
        float bestScore = -2.0f;
        for (size_t c = 0; c < centroids_.size(); ++c) {
            float score = vector_utils::dot(v, centroids_[c]);
            if (score > bestScore) {
                bestScore = score;
                best = c;
            }
        }
        return best;
    }

    void attachToList(size_t slot) {
        size_t list = nearestCentroid(store_.vector(slot));
        slotList_[slot] = list;
        lists_[list].push_back(slot);
    }

    void detachFromList(size_t slot) {
        auto& list = lists_[slotList_[slot]];
        list.erase(std::remove(list.begin(), list.end(), slot), list.end());
    }

    SlotStore store_;
    std::vector<size_t> slotList_; // slot -> inverted list
    std::vector<std::vector<float>> centroids_;
    std::vector<std::vector<size_t>> lists_;
    bool trained_ = false;
    bool deferTraining_ = false;
};

// =============================================================================
// Factory Function
// =============================================================================

std::unique_ptr<VectorIndex>
createVectorIndex(IndexType type, const IndexConfig& config,
                  const std::vector<std::pair<std::string, std::vector<float>>>& entries) {
    switch (type) {
        case IndexType::FLAT: {
            auto index = std::make_unique<FlatIndex>(config);
            for (const auto& [id, vector] : entries) {
                auto result = index->upsert(id, vector);
                if (!result) {
                    spdlog::warn("[VectorIndex] Skipping '{}' while building: {}", id,
                                 result.error().message);
                }
            }
            return index;
        }
        case IndexType::IVF_FLAT: {
            auto index = std::make_unique<IvfFlatIndex>(config);
            // Load everything first so training sees the full distribution.
            index->setDeferTraining(true);
            for (const auto& [id, vector] : entries) {
                auto result = index->upsert(id, vector);
                if (!result) {
                    spdlog::warn("[VectorIndex] Skipping '{}' while building: {}", id,
                                 result.error().message);
                }
            }
            index->setDeferTraining(false);
            index->train();
            return index;
        }
    }
    return nullptr;
}

// =============================================================================
// Utility Functions
// =============================================================================

namespace vector_utils {

float dot(const std::vector<float>& a, const std::vector<float>& b) {
    float sum = 0.0f;
    size_t n = std::min(a.size(), b.size());
    for (size_t i = 0; i < n; ++i) {
        sum += a[i] * b[i];
    }
    return sum;
}

float cosineSimilarity(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size()) {
        return 0.0f;
    }
    float dot_ab = 0.0f, norm_a = 0.0f, norm_b = 0.0f;
    for (size_t i = 0; i < a.size(); ++i) {
        dot_ab += a[i] * b[i];
        norm_a += a[i] * a[i];
        norm_b += b[i] * b[i];
    }
    // Zero-norm inputs have no direction; treat them as unrelated.
    if (norm_a == 0.0f || norm_b == 0.0f) {
        return 0.0f;
    }
    return clampSimilarity(dot_ab / (std::sqrt(norm_a) * std::sqrt(norm_b)));
}

std::vector<float> normalize(const std::vector<float>& vector) {
    float norm = 0.0f;
    for (float val : vector) {
        norm += val * val;
    }
    norm = std::sqrt(norm);

    if (norm == 0.0f) {
        return vector;
    }

    std::vector<float> normalized;
    normalized.reserve(vector.size());
    for (float val : vector) {
        normalized.push_back(val / norm);
    }

    return normalized;
}

bool rankBefore(const SearchResult& a, const SearchResult& b) {
    if (a.similarity != b.similarity) {
        return a.similarity > b.similarity;
    }
    return a.id < b.id;
}

} // namespace vector_utils

} // namespace murmur::vector
