#pragma once

#include <murmur/core/types.h>
#include <murmur/identity/principal.h>
#include <murmur/vector/vector_index.h>

#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace murmur::vector {

using IndexEntries = std::vector<std::pair<std::string, std::vector<float>>>;

/**
 * Supplies the persisted (chunk id, embedding) pairs of one owner the first
 * time that owner's partition is touched.
 */
using PartitionLoader = std::function<Result<IndexEntries>(const identity::Principal&)>;

struct PartitionStats {
    size_t vectors = 0;
    IndexType type = IndexType::FLAT;
};

/**
 * Similarity index partitioned by owner.
 *
 * Each owner gets its own VectorIndex behind its own reader/writer lock, so a
 * search can only ever see vectors inserted under the same principal. A write
 * is visible to the next search on that partition once upsert() returns.
 *
 * A partition is exact (flat) while small and is rebuilt as IVF once it grows
 * past exact_search_threshold; it drops back to flat when it shrinks below
 * half of that.
 */
class TenantVectorIndex {
public:
    explicit TenantVectorIndex(const IndexConfig& config, PartitionLoader loader = {});
    ~TenantVectorIndex();

    TenantVectorIndex(const TenantVectorIndex&) = delete;
    TenantVectorIndex& operator=(const TenantVectorIndex&) = delete;

    Result<void> upsert(const identity::Principal& owner, const std::string& id,
                        const std::vector<float>& vector);

    /// Removes whichever of `ids` are present; returns how many were.
    Result<size_t> remove(const identity::Principal& owner, const std::vector<std::string>& ids);

    Result<std::vector<SearchResult>> search(const identity::Principal& owner,
                                             const std::vector<float>& query, size_t k,
                                             float threshold);

    /// Forget an owner's partition entirely; the next touch reloads it.
    void dropPartition(const identity::Principal& owner);

    Result<PartitionStats> stats(const identity::Principal& owner);

    size_t partitionCount() const;
    size_t dimension() const { return config_.dimension; }

private:
    struct Partition {
        std::shared_mutex mutex;
        std::unique_ptr<VectorIndex> index;
        bool loaded = false;
    };

    std::shared_ptr<Partition> partitionFor(const identity::Principal& owner);
    Result<void> ensureLoaded(const identity::Principal& owner, Partition& partition);
    void rebalance(const identity::Principal& owner, Partition& partition);
    IndexType strategyFor(size_t size) const;

    IndexConfig config_;
    PartitionLoader loader_;

    mutable std::mutex partitionsMutex_;
    std::unordered_map<identity::Principal, std::shared_ptr<Partition>> partitions_;
};

} // namespace murmur::vector
