#include <murmur/vector/tenant_vector_index.h>

#include <spdlog/spdlog.h>

namespace murmur::vector {

TenantVectorIndex::TenantVectorIndex(const IndexConfig& config, PartitionLoader loader)
    : config_(config), loader_(std::move(loader)) {}

TenantVectorIndex::~TenantVectorIndex() = default;

std::shared_ptr<TenantVectorIndex::Partition>
TenantVectorIndex::partitionFor(const identity::Principal& owner) {
    std::lock_guard<std::mutex> lock(partitionsMutex_);
    auto& slot = partitions_[owner];
    if (!slot) {
        slot = std::make_shared<Partition>();
    }
    return slot;
}

IndexType TenantVectorIndex::strategyFor(size_t size) const {
    return size > config_.exact_search_threshold ? IndexType::IVF_FLAT : IndexType::FLAT;
}

// Caller holds the partition's exclusive lock.
Result<void> TenantVectorIndex::ensureLoaded(const identity::Principal& owner,
                                             Partition& partition) {
    if (partition.loaded) {
        return {};
    }

    IndexEntries entries;
    if (loader_) {
        auto loaded = loader_(owner);
        if (!loaded) {
            spdlog::error("[TenantVectorIndex] Failed to hydrate partition for {}: {}", owner.id(),
                          loaded.error().message);
            return loaded.error();
        }
        entries = std::move(loaded).value();
    }

    partition.index = createVectorIndex(strategyFor(entries.size()), config_, entries);
    partition.loaded = true;
    spdlog::debug("[TenantVectorIndex] Hydrated partition for {} with {} vectors ({})",
                  owner.id(), partition.index->size(), indexTypeName(partition.index->type()));
    return {};
}

// Caller holds the partition's exclusive lock.
void TenantVectorIndex::rebalance(const identity::Principal& owner, Partition& partition) {
    const size_t size = partition.index->size();
    const IndexType current = partition.index->type();

    IndexType target = current;
    if (current == IndexType::FLAT && size > config_.exact_search_threshold) {
        target = IndexType::IVF_FLAT;
    } else if (current == IndexType::IVF_FLAT && size < config_.exact_search_threshold / 2) {
        target = IndexType::FLAT;
    }
    if (target == current) {
        return;
    }

    spdlog::info("[TenantVectorIndex] Rebuilding partition for {} as {} ({} vectors)", owner.id(),
                 indexTypeName(target), size);
    partition.index = createVectorIndex(target, config_, partition.index->entries());
}

Result<void> TenantVectorIndex::upsert(const identity::Principal& owner, const std::string& id,
                                       const std::vector<float>& vector) {
    if (vector.size() != config_.dimension) {
        return Error{ErrorCode::DimensionMismatch,
                     "Vector dimension " + std::to_string(vector.size()) +
                         " does not match index dimension " + std::to_string(config_.dimension)};
    }

    auto partition = partitionFor(owner);
    std::unique_lock<std::shared_mutex> lock(partition->mutex);
    auto loaded = ensureLoaded(owner, *partition);
    if (!loaded) {
        return loaded;
    }

    auto result = partition->index->upsert(id, vector);
    if (!result) {
        return result;
    }
    rebalance(owner, *partition);
    return {};
}

Result<size_t> TenantVectorIndex::remove(const identity::Principal& owner,
                                         const std::vector<std::string>& ids) {
    auto partition = partitionFor(owner);
    std::unique_lock<std::shared_mutex> lock(partition->mutex);
    auto loaded = ensureLoaded(owner, *partition);
    if (!loaded) {
        return loaded.error();
    }

    size_t removed = 0;
    for (const auto& id : ids) {
        if (partition->index->remove(id)) {
            ++removed;
        }
    }
    if (removed > 0) {
        rebalance(owner, *partition);
    }
    return removed;
}

Result<std::vector<SearchResult>> TenantVectorIndex::search(const identity::Principal& owner,
                                                            const std::vector<float>& query,
                                                            size_t k, float threshold) {
    auto partition = partitionFor(owner);
    {
        std::shared_lock<std::shared_mutex> lock(partition->mutex);
        if (partition->loaded) {
            return partition->index->search(query, k, threshold);
        }
    }

    std::unique_lock<std::shared_mutex> lock(partition->mutex);
    auto loaded = ensureLoaded(owner, *partition);
    if (!loaded) {
        return loaded.error();
    }
    return partition->index->search(query, k, threshold);
}

void TenantVectorIndex::dropPartition(const identity::Principal& owner) {
    std::lock_guard<std::mutex> lock(partitionsMutex_);
    partitions_.erase(owner);
}

Result<PartitionStats> TenantVectorIndex::stats(const identity::Principal& owner) {
    auto partition = partitionFor(owner);
    std::unique_lock<std::shared_mutex> lock(partition->mutex);
    auto loaded = ensureLoaded(owner, *partition);
    if (!loaded) {
        return loaded.error();
    }
    return PartitionStats{partition->index->size(), partition->index->type()};
}

size_t TenantVectorIndex::partitionCount() const {
    std::lock_guard<std::mutex> lock(partitionsMutex_);
    return partitions_.size();
}

} // namespace murmur::vector
