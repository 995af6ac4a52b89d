#include <murmur/core/uuid.h>
#include <murmur/ingest/ingestion_pipeline.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <thread>

namespace murmur::ingest {

namespace {

// Item errors the provider will repeat for the same text.
bool isPermanentRejection(ErrorCode code) {
    return code == ErrorCode::InvalidInput || code == ErrorCode::DimensionMismatch;
}

} // namespace

Result<void> validate(const PipelineConfig& config) {
    if (config.fetch_timeout.count() <= 0) {
        return Error{ErrorCode::ConfigurationError, "fetch_timeout must be positive"};
    }
    if (config.fetch_max_attempts == 0) {
        return Error{ErrorCode::ConfigurationError, "fetch_max_attempts must be at least 1"};
    }
    if (config.pending_batch_limit == 0) {
        return Error{ErrorCode::ConfigurationError, "pending_batch_limit must be positive"};
    }
    return {};
}

IngestionPipeline::IngestionPipeline(metadata::MessageRepository& repository,
                                     sync::SyncStateTracker& tracker,
                                     vector::TenantVectorIndex& index,
                                     vector::EmbeddingGateway& gateway,
                                     chunking::TextChunker chunker, PipelineConfig config)
    : repository_(repository), tracker_(tracker), index_(index), gateway_(gateway),
      chunker_(std::move(chunker)), config_(config),
      sleeper_([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }) {}

void IngestionPipeline::setSleepFunction(SleepFunction sleeper) {
    sleeper_ = std::move(sleeper);
}

Result<SyncReport> IngestionPipeline::runSync(const identity::Principal& owner,
                                              const std::string& source,
                                              IMessageSourceFetcher& fetcher,
                                              const CancellationToken* cancel) {
    if (auto valid = validate(config_); !valid) {
        return valid.error();
    }
    if (auto valid = chunking::validate(chunker_.config()); !valid) {
        return valid.error();
    }

    auto started = tracker_.begin(owner, source);
    if (!started) {
        return started.error();
    }

    SyncReport report;
    report.cursor = started.value().cursor;

    spdlog::info("[IngestionPipeline] Sync {}/{} starting at cursor '{}'", owner.id(), source,
                 report.cursor);

    // Once begin() succeeded every exit has to leave running through
    // complete() or fail(), exceptions included.
    Result<void> ran{Error{ErrorCode::InternalError, "Sync did not run"}};
    try {
        ran = runPages(owner, source, fetcher, cancel, report);
    } catch (const std::exception& e) {
        spdlog::error("[IngestionPipeline] Sync {}/{} aborted: {}", owner.id(), source,
                      e.what());
        ran = Error{ErrorCode::InternalError, std::string("Sync aborted: ") + e.what()};
    }
    if (!ran) {
        return failRun(owner, source, std::move(report), ran.error().message);
    }

    spdlog::info("[IngestionPipeline] Sync {}/{} done: fetched={} inserted={} duplicates={} "
                 "chunks={} embedded={} pending={} recovered={}",
                 owner.id(), source, report.fetched, report.inserted, report.duplicates,
                 report.chunksWritten, report.chunksEmbedded, report.chunksPending,
                 report.pendingRecovered);
    return report;
}

Result<void> IngestionPipeline::runPages(const identity::Principal& owner,
                                         const std::string& source,
                                         IMessageSourceFetcher& fetcher,
                                         const CancellationToken* cancel, SyncReport& report) {
    auto recovered = recoverPending(owner);
    if (recovered) {
        report.pendingRecovered = recovered.value();
    } else {
        spdlog::warn("[IngestionPipeline] Pending recovery for {} skipped: {}", owner.id(),
                     recovered.error().message);
    }

    const Error cancelled{ErrorCode::OperationCancelled, "Sync cancelled"};
    std::string cursor = report.cursor;
    while (true) {
        if (cancel && cancel->isCancelled()) {
            return cancelled;
        }

        auto page = fetchWithRetry(owner, source, fetcher, cursor);
        if (!page) {
            return Error{page.error().code, "Fetch failed: " + page.error().message};
        }

        const auto& fetched = page.value();
        report.pages++;
        report.fetched += fetched.messages.size();

        for (const auto& raw : fetched.messages) {
            if (cancel && cancel->isCancelled()) {
                return cancelled;
            }
            if (auto ingested = ingestMessage(owner, raw, report); !ingested) {
                return ingested;
            }
        }

        if (!fetched.hasMore) {
            if (auto completed = tracker_.complete(owner, source, fetched.nextCursor);
                !completed) {
                return completed;
            }
            report.cursor = fetched.nextCursor;
            report.finalStatus = sync::SyncStatus::Idle;
            return {};
        }

        if (fetched.nextCursor == cursor) {
            return Error{ErrorCode::InvalidData,
                         "Fetcher reported more pages without advancing the cursor"};
        }

        if (auto checkpointed = tracker_.checkpoint(owner, source, fetched.nextCursor);
            !checkpointed) {
            return checkpointed;
        }
        cursor = fetched.nextCursor;
        report.cursor = cursor;
    }
}

SyncReport IngestionPipeline::failRun(const identity::Principal& owner, const std::string& source,
                                      SyncReport report, const std::string& reason) {
    auto failed = tracker_.fail(owner, source, reason);
    if (!failed) {
        spdlog::error("[IngestionPipeline] Could not record failure for {}/{}: {}", owner.id(),
                      source, failed.error().message);
    }
    report.finalStatus = sync::SyncStatus::Error;
    report.error = reason;
    return report;
}

Result<FetchPage> IngestionPipeline::fetchWithRetry(const identity::Principal& owner,
                                                    const std::string& source,
                                                    IMessageSourceFetcher& fetcher,
                                                    const std::string& cursor) {
    auto backoff = config_.fetch_initial_backoff;
    Error lastError{ErrorCode::ProviderUnavailable, "No attempt made"};

    for (size_t attempt = 0; attempt < config_.fetch_max_attempts; ++attempt) {
        Result<FetchPage> result{Error{ErrorCode::ProviderUnavailable, "No response"}};
        try {
            result = fetcher.fetch(owner, source, cursor, config_.fetch_timeout);
        } catch (const std::exception& e) {
            result = Error{ErrorCode::ProviderUnavailable, std::string("Fetcher threw: ") + e.what()};
        }

        if (result) {
            return result;
        }
        lastError = result.error();
        if (!isTransient(lastError.code)) {
            return lastError;
        }

        if (attempt + 1 < config_.fetch_max_attempts) {
            spdlog::warn("[IngestionPipeline] Fetch attempt {}/{} failed ({}), retrying in {}ms",
                         attempt + 1, config_.fetch_max_attempts, lastError.message,
                         backoff.count());
            sleeper_(backoff);
            backoff *= 2;
        }
    }

    return Error{ErrorCode::ProviderUnavailable, lastError.message};
}

Result<void> IngestionPipeline::ingestMessage(const identity::Principal& owner,
                                              const RawMessage& raw, SyncReport& report) {
    // Dedup before any chunk or embedding work.
    if (raw.externalId) {
        auto existing = repository_.findMessageByExternalId(owner, *raw.externalId);
        if (!existing) {
            return existing.error();
        }
        if (existing.value()) {
            report.duplicates++;
            spdlog::debug("[IngestionPipeline] Skipping known message {}", *raw.externalId);
            return {};
        }
    }

    auto pieces = chunker_.chunk(raw.body);
    if (!pieces) {
        return pieces.error();
    }
    const auto& texts = pieces.value();

    std::vector<metadata::Chunk> chunks;
    chunks.reserve(texts.size());
    for (size_t i = 0; i < texts.size(); ++i) {
        metadata::Chunk chunk;
        chunk.id = core::generateUUID();
        chunk.chunkIndex = static_cast<int>(i);
        chunk.content = texts[i];
        chunks.push_back(std::move(chunk));
    }

    if (!chunks.empty()) {
        auto embedded = gateway_.embed(texts);
        if (!embedded) {
            if (embedded.error().code != ErrorCode::ProviderUnavailable) {
                return embedded.error();
            }
            spdlog::warn("[IngestionPipeline] Embedding unavailable, storing {} chunks as pending: "
                         "{}",
                         chunks.size(), embedded.error().message);
        } else {
            auto& items = embedded.value();
            for (size_t i = 0; i < chunks.size(); ++i) {
                if (items[i]) {
                    chunks[i].embedding = items[i].value();
                    continue;
                }
                const auto& itemError = items[i].error();
                if (isPermanentRejection(itemError.code)) {
                    report.itemsRejected++;
                    chunks[i].embedError = itemError.message;
                }
                spdlog::warn("[IngestionPipeline] Chunk {} left unembedded: {}", i,
                             itemError.message);
            }
        }
    }

    metadata::ConversationUpsert conversation;
    conversation.externalId = raw.conversationExternalId;
    conversation.title = raw.conversationTitle;
    conversation.participants = raw.participants;
    conversation.messageSentAt = raw.sentAt;

    metadata::Message message;
    message.externalId = raw.externalId;
    message.senderId = raw.senderId;
    message.sentAt = raw.sentAt;
    message.body = raw.body;
    message.metadata = raw.metadata;

    auto committed = repository_.commitMessage(owner, conversation, std::move(message), chunks);
    if (!committed) {
        if (committed.error().code == ErrorCode::DuplicateExternalId) {
            report.duplicates++;
            return {};
        }
        return committed.error();
    }

    report.inserted++;
    report.chunksWritten += committed.value().chunksWritten;
    for (const auto& chunk : chunks) {
        if (chunk.embedding) {
            report.chunksEmbedded++;
        } else {
            report.chunksPending++;
        }
    }

    indexChunks(owner, chunks, report);
    return {};
}

void IngestionPipeline::indexChunks(const identity::Principal& owner,
                                    const std::vector<metadata::Chunk>& chunks,
                                    SyncReport& report) {
    for (const auto& chunk : chunks) {
        if (!chunk.embedding) {
            continue;
        }
        auto upserted = index_.upsert(owner, chunk.id, *chunk.embedding);
        if (!upserted) {
            // The row is committed; the partition picks it up on its next hydration.
            report.indexSkipped++;
            spdlog::warn("[IngestionPipeline] Chunk {} not indexed: {}", chunk.id,
                         upserted.error().message);
        }
    }
}

Result<size_t> IngestionPipeline::recoverPending(const identity::Principal& owner) {
    auto pending = repository_.listPendingChunks(owner, config_.pending_batch_limit);
    if (!pending) {
        return pending.error();
    }
    auto& chunks = pending.value();
    if (chunks.empty()) {
        return size_t{0};
    }

    std::vector<std::string> texts;
    texts.reserve(chunks.size());
    for (const auto& chunk : chunks) {
        texts.push_back(chunk.content);
    }

    auto embedded = gateway_.embed(texts);
    if (!embedded) {
        return embedded.error();
    }

    size_t recovered = 0;
    auto& items = embedded.value();
    for (size_t i = 0; i < chunks.size(); ++i) {
        if (!items[i]) {
            const auto& itemError = items[i].error();
            if (isPermanentRejection(itemError.code)) {
                auto marked = repository_.markChunkRejected(owner, chunks[i].id,
                                                            itemError.message);
                if (!marked) {
                    return marked.error();
                }
                spdlog::warn("[IngestionPipeline] Pending chunk {} rejected: {}", chunks[i].id,
                             itemError.message);
            }
            continue;
        }
        auto updated = repository_.updateChunkEmbedding(owner, chunks[i].id, items[i].value());
        if (!updated) {
            return updated.error();
        }
        auto upserted = index_.upsert(owner, chunks[i].id, items[i].value());
        if (!upserted) {
            spdlog::warn("[IngestionPipeline] Recovered chunk {} not indexed: {}", chunks[i].id,
                         upserted.error().message);
        }
        recovered++;
    }

    if (recovered > 0) {
        spdlog::info("[IngestionPipeline] Re-embedded {} of {} pending chunks for {}", recovered,
                     chunks.size(), owner.id());
    }
    return recovered;
}

} // namespace murmur::ingest
