#pragma once

#include <murmur/config/engine_config.h>
#include <murmur/core/types.h>
#include <murmur/core/work_coordinator.h>
#include <murmur/identity/identity_resolver.h>
#include <murmur/ingest/ingestion_pipeline.h>
#include <murmur/ingest/message_source.h>
#include <murmur/metadata/database.h>
#include <murmur/metadata/message_repository.h>
#include <murmur/ml/provider.h>
#include <murmur/sync/sync_state_tracker.h>
#include <murmur/vector/embedding_gateway.h>
#include <murmur/vector/tenant_vector_index.h>

#include <atomic>
#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace murmur::app {

/**
 * A search result with the chunk it points at.
 */
struct SearchHit {
    std::string chunkId;
    std::string messageId;
    int chunkIndex = 0;
    std::string content;
    float similarity = 0.0f;
};

/**
 * Handle to a sync queued with Engine::scheduleSync.
 */
class SyncHandle {
public:
    SyncHandle(std::shared_ptr<ingest::CancellationToken> token,
               std::future<Result<ingest::SyncReport>> report)
        : token_(std::move(token)), report_(std::move(report)) {}

    /// Request cancellation; honored between message units.
    void cancel() { token_->cancel(); }

    /// Block until the sync finishes. Valid once.
    Result<ingest::SyncReport> get() { return report_.get(); }

    bool waitFor(std::chrono::milliseconds timeout) const {
        return report_.wait_for(timeout) == std::future_status::ready;
    }

private:
    std::shared_ptr<ingest::CancellationToken> token_;
    std::future<Result<ingest::SyncReport>> report_;
};

/**
 * Facade over storage, index, embedding and sync.
 *
 * Every operation takes a Principal obtained from resolvePrincipal(); none
 * accepts a raw owner id. Syncs scheduled for one owner run one after
 * another on that owner's strand while different owners run in parallel.
 */
class Engine {
public:
    Engine(config::EngineConfig config, std::shared_ptr<identity::IIdentityResolver> resolver,
           std::shared_ptr<ml::IEmbeddingProvider> provider);
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    /// Configure logging, open and migrate the database, start the workers.
    Result<void> open();

    /// Stop accepting work and wait for scheduled syncs to drain.
    void shutdown();

    // Identity
    Result<identity::Principal> resolvePrincipal(const std::string& credential);

    // Sources
    void registerSource(const std::string& source,
                        std::shared_ptr<ingest::IMessageSourceFetcher> fetcher);

    // Sync
    Result<ingest::SyncReport> runSync(const identity::Principal& owner,
                                       const std::string& source);
    Result<SyncHandle> scheduleSync(const identity::Principal& owner, const std::string& source);
    Result<sync::SyncSnapshot> getSyncStatus(const identity::Principal& owner,
                                             const std::string& source);

    // Search; k and threshold fall back to the configured defaults.
    Result<std::vector<SearchHit>> search(const identity::Principal& owner,
                                          const std::vector<float>& queryVector,
                                          std::optional<size_t> k = std::nullopt,
                                          std::optional<float> threshold = std::nullopt);
    Result<std::vector<SearchHit>> searchText(const identity::Principal& owner,
                                              const std::string& queryText,
                                              std::optional<size_t> k = std::nullopt,
                                              std::optional<float> threshold = std::nullopt);

    // Deletes
    Result<void> deleteConversation(const identity::Principal& owner,
                                    const std::string& conversationId);
    Result<void> deleteMessage(const identity::Principal& owner, const std::string& messageId);
    Result<void> purgeOwner(const identity::Principal& owner);

    Result<vector::PartitionStats> indexStats(const identity::Principal& owner);

    const config::EngineConfig& config() const { return config_; }

    /// Direct repository access for tooling and tests; null before open().
    metadata::MessageRepository* repository() { return repository_.get(); }

private:
    Result<void> requireOpen() const;
    Result<std::shared_ptr<ingest::IMessageSourceFetcher>> fetcherFor(const std::string& source);
    core::WorkCoordinator::Strand strandFor(const identity::Principal& owner);

    config::EngineConfig config_;
    std::shared_ptr<identity::IIdentityResolver> resolver_;
    std::shared_ptr<ml::IEmbeddingProvider> provider_;

    std::unique_ptr<metadata::Database> db_;
    std::unique_ptr<metadata::MessageRepository> repository_;
    std::unique_ptr<sync::SyncStateTracker> tracker_;
    std::unique_ptr<vector::EmbeddingGateway> gateway_;
    std::unique_ptr<vector::TenantVectorIndex> index_;
    std::unique_ptr<ingest::IngestionPipeline> pipeline_;
    core::WorkCoordinator coordinator_;

    std::mutex mutex_;
    std::map<std::string, std::shared_ptr<ingest::IMessageSourceFetcher>> sources_;
    std::unordered_map<identity::Principal, core::WorkCoordinator::Strand> strands_;
    std::atomic<bool> open_{false};
};

} // namespace murmur::app
