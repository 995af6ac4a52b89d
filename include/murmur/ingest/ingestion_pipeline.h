#pragma once

#include <murmur/chunking/text_chunker.h>
#include <murmur/core/types.h>
#include <murmur/identity/principal.h>
#include <murmur/ingest/message_source.h>
#include <murmur/metadata/message_repository.h>
#include <murmur/sync/sync_state_tracker.h>
#include <murmur/vector/embedding_gateway.h>
#include <murmur/vector/tenant_vector_index.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <string>

namespace murmur::ingest {

/**
 * Cooperative cancellation flag, checked between message units.
 */
class CancellationToken {
public:
    void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }
    bool isCancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> cancelled_{false};
};

struct PipelineConfig {
    std::chrono::milliseconds fetch_timeout{30000};
    size_t fetch_max_attempts = 3;
    std::chrono::milliseconds fetch_initial_backoff{500};
    size_t pending_batch_limit = 256; // pending chunks re-embedded per run
};

Result<void> validate(const PipelineConfig& config);

/**
 * Outcome of one runSync call.
 */
struct SyncReport {
    size_t pages = 0;
    size_t fetched = 0;
    size_t inserted = 0;
    size_t duplicates = 0;
    size_t chunksWritten = 0;
    size_t chunksEmbedded = 0;
    size_t chunksPending = 0;  // written with a NULL embedding
    size_t itemsRejected = 0;  // of chunksPending, refused by the provider
    size_t pendingRecovered = 0;
    size_t indexSkipped = 0;
    sync::SyncStatus finalStatus = sync::SyncStatus::Idle;
    std::string cursor;
    std::string error;
};

/**
 * fetch -> dedup -> chunk -> embed -> persist -> index, one message at a time.
 *
 * Each message is committed as its own transaction. The cursor is
 * checkpointed after every fully committed page and moved to the final
 * cursor on completion, so a failed or cancelled run resumes at most one page
 * back and the dedup key absorbs the replay.
 *
 * Embedding outages do not fail the run: the message is stored with pending
 * (NULL) embeddings that later runs retry. Fetch failures, storage failures
 * and cancellation move the sync to error with the last checkpoint kept.
 */
class IngestionPipeline {
public:
    using SleepFunction = std::function<void(std::chrono::milliseconds)>;

    IngestionPipeline(metadata::MessageRepository& repository, sync::SyncStateTracker& tracker,
                      vector::TenantVectorIndex& index, vector::EmbeddingGateway& gateway,
                      chunking::TextChunker chunker, PipelineConfig config = {});

    /**
     * Run one sync for (owner, source).
     *
     * Returns an error only when the run could not start (SyncAlreadyRunning,
     * storage failure). Once started, the report's finalStatus tells whether
     * it ended idle or in error.
     */
    Result<SyncReport> runSync(const identity::Principal& owner, const std::string& source,
                               IMessageSourceFetcher& fetcher,
                               const CancellationToken* cancel = nullptr);

    /// Re-embed up to pending_batch_limit pending chunks of the owner. Chunks
    /// the provider rejects outright are marked and leave the queue.
    Result<size_t> recoverPending(const identity::Principal& owner);

    void setSleepFunction(SleepFunction sleeper);

private:
    // Recovery, pages and completion of a started run. An error return is
    // the reason the run failed.
    Result<void> runPages(const identity::Principal& owner, const std::string& source,
                          IMessageSourceFetcher& fetcher, const CancellationToken* cancel,
                          SyncReport& report);

    Result<FetchPage> fetchWithRetry(const identity::Principal& owner, const std::string& source,
                                     IMessageSourceFetcher& fetcher, const std::string& cursor);

    // One message unit of work. Errors returned here are fatal for the run.
    Result<void> ingestMessage(const identity::Principal& owner, const RawMessage& raw,
                               SyncReport& report);

    void indexChunks(const identity::Principal& owner,
                     const std::vector<metadata::Chunk>& chunks, SyncReport& report);

    // Move the sync to error and stamp the report with the reason.
    SyncReport failRun(const identity::Principal& owner, const std::string& source,
                       SyncReport report, const std::string& reason);

    metadata::MessageRepository& repository_;
    sync::SyncStateTracker& tracker_;
    vector::TenantVectorIndex& index_;
    vector::EmbeddingGateway& gateway_;
    chunking::TextChunker chunker_;
    PipelineConfig config_;
    SleepFunction sleeper_;
};

} // namespace murmur::ingest
