#pragma once

#include <murmur/core/types.h>

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace murmur::vector {

/**
 * Types of vector indices supported
 */
enum class IndexType {
    FLAT,    // Exact brute-force search
    IVF_FLAT // Inverted File: k-means coarse quantizer, flat lists
};

const char* indexTypeName(IndexType type);

/**
 * Configuration for vector indices
 */
struct IndexConfig {
    size_t dimension = 1536;

    // A partition is exact while it holds at most this many vectors and is
    // rebuilt as IVF once it grows past it.
    size_t exact_search_threshold = 10000;

    // IVF parameters
    size_t ivf_nlist = 100;         // Number of clusters
    size_t ivf_nprobe = 10;         // Clusters to search
    size_t kmeans_iterations = 20;  // Lloyd iterations during training
    uint64_t seed = 42;             // Centroid initialization seed
};

Result<void> validate(const IndexConfig& config);

/**
 * Search result from vector index
 */
struct SearchResult {
    std::string id;   // Chunk identifier
    float similarity; // 1 - cosine distance

    SearchResult() : similarity(0.0f) {}
    SearchResult(std::string id_, float sim) : id(std::move(id_)), similarity(sim) {}
};

/**
 * Similarities this close to 1 are reported as 1 to absorb float rounding on
 * self matches. Thresholds themselves are compared exactly.
 */
inline constexpr float kSimilarityEpsilon = 1e-5f;

/**
 * Base class for vector indices.
 *
 * Implementations are not internally synchronized; the owning partition
 * serializes writers against readers.
 */
class VectorIndex {
public:
    explicit VectorIndex(const IndexConfig& config) : config_(config) {}
    virtual ~VectorIndex() = default;

    VectorIndex(const VectorIndex&) = delete;
    VectorIndex& operator=(const VectorIndex&) = delete;

    /// Insert or replace; DimensionMismatch when the size differs from config.
    virtual Result<void> upsert(const std::string& id, const std::vector<float>& vector) = 0;

    /// Idempotent: returns true when something was removed.
    virtual bool remove(const std::string& id) = 0;

    /**
     * Top-k by similarity (descending, ties by id ascending), keeping only
     * results with similarity >= threshold.
     */
    virtual Result<std::vector<SearchResult>> search(const std::vector<float>& query, size_t k,
                                                     float threshold) const = 0;

    virtual bool contains(const std::string& id) const = 0;
    virtual size_t size() const = 0;
    virtual IndexType type() const = 0;

    /// Every stored (id, normalized vector) pair; used to rebuild under another strategy.
    virtual std::vector<std::pair<std::string, std::vector<float>>> entries() const = 0;

    size_t dimension() const { return config_.dimension; }
    const IndexConfig& getConfig() const { return config_; }

protected:
    IndexConfig config_;
};

/**
 * Factory function for creating specific index types. An IVF index built from
 * `entries` is trained on them; an empty IVF index trains on its first upserts.
 */
std::unique_ptr<VectorIndex>
createVectorIndex(IndexType type, const IndexConfig& config,
                  const std::vector<std::pair<std::string, std::vector<float>>>& entries = {});

/**
 * Utility functions for vector operations
 */
namespace vector_utils {

/**
 * Cosine similarity in [-1, 1]; 0 when either vector has zero norm.
 */
float cosineSimilarity(const std::vector<float>& a, const std::vector<float>& b);

/**
 * Dot product of equally sized vectors
 */
float dot(const std::vector<float>& a, const std::vector<float>& b);

/**
 * Normalize a vector to unit length (zero vectors are returned unchanged)
 */
std::vector<float> normalize(const std::vector<float>& vector);

/**
 * Ordering used by every search: similarity descending, then id ascending.
 */
bool rankBefore(const SearchResult& a, const SearchResult& b);

} // namespace vector_utils

} // namespace murmur::vector
