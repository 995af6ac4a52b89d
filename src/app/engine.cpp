#include <murmur/app/engine.h>
#include <murmur/core/logging.h>
#include <murmur/metadata/migration.h>

#include <spdlog/spdlog.h>

#include <cmath>
#include <filesystem>
#include <unordered_map>

namespace murmur::app {

Engine::Engine(config::EngineConfig config,
               std::shared_ptr<identity::IIdentityResolver> resolver,
               std::shared_ptr<ml::IEmbeddingProvider> provider)
    : config_(std::move(config)), resolver_(std::move(resolver)), provider_(std::move(provider)) {}

Engine::~Engine() {
    shutdown();
}

Result<void> Engine::open() {
    if (open_) {
        return Error{ErrorCode::InvalidState, "Engine already open"};
    }
    if (auto valid = config_.validate(); !valid) {
        return valid;
    }
    if (auto logging = core::configureLogging(config_.logging); !logging) {
        return logging;
    }
    if (!resolver_) {
        return Error{ErrorCode::ConfigurationError, "No identity resolver configured"};
    }
    if (!provider_) {
        return Error{ErrorCode::ConfigurationError, "No embedding provider configured"};
    }
    if (provider_->getEmbeddingDimension() != config_.embedding.dimension) {
        return Error{ErrorCode::ConfigurationError,
                     "Provider '" + provider_->getProviderName() + "' produces dimension " +
                         std::to_string(provider_->getEmbeddingDimension()) + ", configured " +
                         std::to_string(config_.embedding.dimension)};
    }

    const std::string path = config_.resolvedDatabasePath();
    auto mode = metadata::ConnectionMode::Create;
    if (path == ":memory:") {
        mode = metadata::ConnectionMode::Memory;
    } else {
        std::error_code ec;
        auto parent = std::filesystem::path(path).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                return Error{ErrorCode::ConfigurationError,
                             "Cannot create database directory " + parent.string() + ": " +
                                 ec.message()};
            }
        }
    }

    db_ = std::make_unique<metadata::Database>();
    auto opened = metadata::openAndMigrate(*db_, path, mode);
    if (!opened) {
        db_.reset();
        return opened;
    }
    if (mode != metadata::ConnectionMode::Memory) {
        auto wal = db_->enableWAL();
        if (!wal) {
            spdlog::warn("[Engine] WAL unavailable, continuing with default journal: {}",
                         wal.error().message);
        }
    }

    repository_ = std::make_unique<metadata::MessageRepository>(*db_);
    tracker_ = std::make_unique<sync::SyncStateTracker>(*repository_);
    gateway_ = std::make_unique<vector::EmbeddingGateway>(provider_, config_.embedding);

    auto* repository = repository_.get();
    index_ = std::make_unique<vector::TenantVectorIndex>(
        config_.index,
        [repository](const identity::Principal& owner) { return repository->loadEmbeddings(owner); });

    pipeline_ = std::make_unique<ingest::IngestionPipeline>(
        *repository_, *tracker_, *index_, *gateway_, chunking::TextChunker(config_.chunking),
        config_.sync);

    coordinator_.start(config_.worker_threads == 0
                           ? std::nullopt
                           : std::optional<std::size_t>(config_.worker_threads));
    open_ = true;

    spdlog::info("[Engine] Open at {} (sqlite {}, dimension {})", path,
                 metadata::Database::version(), config_.embedding.dimension);
    return {};
}

void Engine::shutdown() {
    if (!open_.exchange(false)) {
        return;
    }
    coordinator_.stop();
    coordinator_.join();
    spdlog::info("[Engine] Shut down");
}

Result<void> Engine::requireOpen() const {
    if (!open_) {
        return Error{ErrorCode::NotInitialized, "Engine is not open"};
    }
    return {};
}

Result<identity::Principal> Engine::resolvePrincipal(const std::string& credential) {
    if (auto ready = requireOpen(); !ready) {
        return ready.error();
    }

    auto resolved = resolver_->resolve(credential);
    if (!resolved) {
        return resolved.error();
    }

    auto ensured = repository_->ensureProfile(resolved.value());
    if (!ensured) {
        return ensured.error();
    }
    return resolved.value().principal;
}

void Engine::registerSource(const std::string& source,
                            std::shared_ptr<ingest::IMessageSourceFetcher> fetcher) {
    std::lock_guard<std::mutex> lock(mutex_);
    sources_[source] = std::move(fetcher);
}

Result<std::shared_ptr<ingest::IMessageSourceFetcher>>
Engine::fetcherFor(const std::string& source) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sources_.find(source);
    if (it == sources_.end() || !it->second) {
        return Error{ErrorCode::NotFound, "No fetcher registered for source '" + source + "'"};
    }
    return it->second;
}

core::WorkCoordinator::Strand Engine::strandFor(const identity::Principal& owner) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = strands_.find(owner);
    if (it == strands_.end()) {
        it = strands_.emplace(owner, coordinator_.makeStrand()).first;
    }
    return it->second;
}

Result<ingest::SyncReport> Engine::runSync(const identity::Principal& owner,
                                           const std::string& source) {
    if (auto ready = requireOpen(); !ready) {
        return ready.error();
    }
    auto fetcher = fetcherFor(source);
    if (!fetcher) {
        return fetcher.error();
    }
    return pipeline_->runSync(owner, source, *fetcher.value());
}

Result<SyncHandle> Engine::scheduleSync(const identity::Principal& owner,
                                        const std::string& source) {
    if (auto ready = requireOpen(); !ready) {
        return ready.error();
    }
    auto fetcher = fetcherFor(source);
    if (!fetcher) {
        return fetcher.error();
    }

    auto token = std::make_shared<ingest::CancellationToken>();
    auto promise = std::make_shared<std::promise<Result<ingest::SyncReport>>>();
    auto future = promise->get_future();

    boost::asio::post(strandFor(owner), [this, owner, source, token, promise,
                                         fetcher = fetcher.value()]() {
        try {
            promise->set_value(pipeline_->runSync(owner, source, *fetcher, token.get()));
        } catch (const std::exception& e) {
            spdlog::error("[Engine] Sync {}/{} aborted: {}", owner.id(), source, e.what());
            promise->set_value(Error{ErrorCode::InternalError, e.what()});
        }
    });

    spdlog::debug("[Engine] Scheduled sync {}/{}", owner.id(), source);
    return SyncHandle(std::move(token), std::move(future));
}

Result<sync::SyncSnapshot> Engine::getSyncStatus(const identity::Principal& owner,
                                                 const std::string& source) {
    if (auto ready = requireOpen(); !ready) {
        return ready.error();
    }
    return tracker_->get(owner, source);
}

Result<std::vector<SearchHit>> Engine::search(const identity::Principal& owner,
                                              const std::vector<float>& queryVector,
                                              std::optional<size_t> k,
                                              std::optional<float> threshold) {
    if (auto ready = requireOpen(); !ready) {
        return ready.error();
    }

    const size_t limit = k.value_or(config_.search.default_k);
    const float minSimilarity = threshold.value_or(config_.search.default_threshold);
    if (limit == 0) {
        return Error{ErrorCode::InvalidArgument, "k must be positive"};
    }
    if (std::isnan(minSimilarity) || minSimilarity < -1.0f || minSimilarity > 1.0f) {
        return Error{ErrorCode::InvalidArgument, "Similarity threshold must be within [-1, 1]"};
    }

    auto matches = index_->search(owner, queryVector, limit, minSimilarity);
    if (!matches) {
        return matches.error();
    }
    if (matches.value().empty()) {
        return std::vector<SearchHit>{};
    }

    std::vector<std::string> ids;
    ids.reserve(matches.value().size());
    for (const auto& match : matches.value()) {
        ids.push_back(match.id);
    }

    auto chunks = repository_->getChunks(owner, ids);
    if (!chunks) {
        return chunks.error();
    }
    std::unordered_map<std::string, const metadata::Chunk*> byId;
    for (const auto& chunk : chunks.value()) {
        byId.emplace(chunk.id, &chunk);
    }

    std::vector<SearchHit> hits;
    hits.reserve(ids.size());
    for (const auto& match : matches.value()) {
        auto it = byId.find(match.id);
        if (it == byId.end()) {
            // Deleted between the index lookup and hydration.
            continue;
        }
        SearchHit hit;
        hit.chunkId = match.id;
        hit.messageId = it->second->messageId;
        hit.chunkIndex = it->second->chunkIndex;
        hit.content = it->second->content;
        hit.similarity = match.similarity;
        hits.push_back(std::move(hit));
    }
    return hits;
}

Result<std::vector<SearchHit>> Engine::searchText(const identity::Principal& owner,
                                                  const std::string& queryText,
                                                  std::optional<size_t> k,
                                                  std::optional<float> threshold) {
    if (auto ready = requireOpen(); !ready) {
        return ready.error();
    }
    if (queryText.empty()) {
        return Error{ErrorCode::InvalidArgument, "Query text must not be empty"};
    }

    auto embedding = gateway_->embedOne(queryText);
    if (!embedding) {
        return embedding.error();
    }
    return search(owner, embedding.value(), k, threshold);
}

Result<void> Engine::deleteConversation(const identity::Principal& owner,
                                        const std::string& conversationId) {
    if (auto ready = requireOpen(); !ready) {
        return ready;
    }
    auto removed = repository_->deleteConversation(owner, conversationId);
    if (!removed) {
        return removed.error();
    }
    auto dropped = index_->remove(owner, removed.value());
    if (!dropped) {
        return dropped.error();
    }
    return {};
}

Result<void> Engine::deleteMessage(const identity::Principal& owner,
                                   const std::string& messageId) {
    if (auto ready = requireOpen(); !ready) {
        return ready;
    }
    auto removed = repository_->deleteMessage(owner, messageId);
    if (!removed) {
        return removed.error();
    }
    auto dropped = index_->remove(owner, removed.value());
    if (!dropped) {
        return dropped.error();
    }
    return {};
}

Result<void> Engine::purgeOwner(const identity::Principal& owner) {
    if (auto ready = requireOpen(); !ready) {
        return ready;
    }
    auto purged = repository_->purgeOwner(owner);
    if (!purged) {
        return purged;
    }
    index_->dropPartition(owner);
    return {};
}

Result<vector::PartitionStats> Engine::indexStats(const identity::Principal& owner) {
    if (auto ready = requireOpen(); !ready) {
        return ready.error();
    }
    return index_->stats(owner);
}

} // namespace murmur::app
