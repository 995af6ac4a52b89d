#include <gtest/gtest.h>
#include <murmur/ingest/ingestion_pipeline.h>
#include <murmur/metadata/migration.h>

#include "../../common/test_helpers.h"

using namespace murmur;
using namespace murmur::ingest;
using murmur::tests::rawMessage;

namespace {

constexpr size_t kDim = 8;

// Always claims another page at the same cursor.
class StuckFetcher : public IMessageSourceFetcher {
public:
    Result<FetchPage> fetch(const identity::Principal&, const std::string&, const std::string&,
                            std::chrono::milliseconds) override {
        FetchPage page;
        page.nextCursor = "";
        page.hasMore = true;
        return page;
    }
};

} // namespace

class IngestionPipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto opened = metadata::openAndMigrate(db_, ":memory:", metadata::ConnectionMode::Memory);
        ASSERT_TRUE(opened.has_value()) << opened.error().message;
        repo_ = std::make_unique<metadata::MessageRepository>(db_);
        tracker_ = std::make_unique<sync::SyncStateTracker>(*repo_);

        provider_ = std::make_shared<tests::ScriptedEmbeddingProvider>(kDim);
        vector::EmbeddingGatewayConfig gatewayConfig;
        gatewayConfig.dimension = kDim;
        gatewayConfig.max_attempts = 2;
        gatewayConfig.jitter = 0.0;
        gateway_ = std::make_unique<vector::EmbeddingGateway>(provider_, gatewayConfig);
        gateway_->setSleepFunction([](std::chrono::milliseconds) {});

        vector::IndexConfig indexConfig;
        indexConfig.dimension = kDim;
        index_ = std::make_unique<vector::TenantVectorIndex>(
            indexConfig, [this](const identity::Principal& owner) {
                return repo_->loadEmbeddings(owner);
            });

        chunkerConfig_.max_chunk_chars = 100;
        chunkerConfig_.overlap_chars = 20;
        chunkerConfig_.lookback_chars = 25;

        PipelineConfig pipelineConfig;
        pipelineConfig.fetch_max_attempts = 3;
        pipelineConfig.fetch_initial_backoff = std::chrono::milliseconds(1);
        pipeline_ = std::make_unique<IngestionPipeline>(*repo_, *tracker_, *index_, *gateway_,
                                                        chunking::TextChunker(chunkerConfig_),
                                                        pipelineConfig);
        pipeline_->setSleepFunction([this](std::chrono::milliseconds d) { sleeps_.push_back(d); });

        owner_ = std::make_unique<identity::Principal>(resolver_.principal("alice"));
        ASSERT_TRUE(repo_->ensureProfile(resolver_.identityFor("alice")).has_value());
    }

    SyncReport run(IMessageSourceFetcher& fetcher, const CancellationToken* cancel = nullptr) {
        auto r = pipeline_->runSync(*owner_, "linkedin", fetcher, cancel);
        EXPECT_TRUE(r.has_value()) << r.error().message;
        return r.value();
    }

    sync::SyncSnapshot state() { return tracker_->get(*owner_, "linkedin").value(); }

    int64_t messages() { return repo_->countMessages(*owner_).value(); }
    int64_t pending() { return repo_->countPendingChunks(*owner_).value(); }
    size_t indexed() { return index_->stats(*owner_).value().vectors; }

    metadata::Database db_;
    std::unique_ptr<metadata::MessageRepository> repo_;
    std::unique_ptr<sync::SyncStateTracker> tracker_;
    std::shared_ptr<tests::ScriptedEmbeddingProvider> provider_;
    std::unique_ptr<vector::EmbeddingGateway> gateway_;
    std::unique_ptr<vector::TenantVectorIndex> index_;
    chunking::ChunkerConfig chunkerConfig_;
    std::unique_ptr<IngestionPipeline> pipeline_;
    std::vector<std::chrono::milliseconds> sleeps_;
    tests::TestIdentityResolver resolver_;
    std::unique_ptr<identity::Principal> owner_;
};

TEST_F(IngestionPipelineTest, IngestsMessagesAndSkipsDuplicates) {
    tests::ScriptedFetcher fetcher;
    fetcher.addPage({rawMessage("m1", "Hello there"), rawMessage("m2", "Lunch tomorrow?"),
                     rawMessage("m1", "Hello there")});

    auto report = run(fetcher);
    EXPECT_EQ(report.finalStatus, sync::SyncStatus::Idle);
    EXPECT_EQ(report.fetched, 3u);
    EXPECT_EQ(report.inserted, 2u);
    EXPECT_EQ(report.duplicates, 1u);
    EXPECT_EQ(report.chunksWritten, 2u);
    EXPECT_EQ(report.chunksEmbedded, 2u);
    EXPECT_EQ(messages(), 2);
    EXPECT_EQ(indexed(), 2u);

    auto s = state();
    EXPECT_EQ(s.status, sync::SyncStatus::Idle);
    EXPECT_EQ(s.cursor, "page-1");
    EXPECT_TRUE(s.lastSyncedAt.has_value());
}

TEST_F(IngestionPipelineTest, ReplayAfterLostCheckpointIsIdempotent) {
    tests::ScriptedFetcher fetcher;
    fetcher.addPage({rawMessage("m1", "one"), rawMessage("m2", "two")});
    fetcher.addPage({rawMessage("m3", "three")});
    run(fetcher);
    ASSERT_EQ(messages(), 3);
    const auto chunks = repo_->countChunks(*owner_).value();

    // Rewind the cursor as if the checkpoint never made it to disk.
    metadata::SyncStateRecord rewound;
    rewound.ownerId = "alice";
    rewound.provider = "linkedin";
    ASSERT_TRUE(repo_->saveSyncState(*owner_, rewound).has_value());

    auto report = run(fetcher);
    EXPECT_EQ(report.finalStatus, sync::SyncStatus::Idle);
    EXPECT_EQ(report.inserted, 0u);
    EXPECT_EQ(report.duplicates, 3u);
    EXPECT_EQ(messages(), 3);
    EXPECT_EQ(repo_->countChunks(*owner_).value(), chunks);
    EXPECT_EQ(indexed(), 3u);
}

TEST_F(IngestionPipelineTest, RejectedChunkStaysPendingOthersIndexed) {
    std::string body;
    for (int i = 0; i <= 150; ++i) {
        body += std::to_string(i);
    }
    auto pieces = chunking::TextChunker(chunkerConfig_).chunk(body);
    ASSERT_TRUE(pieces.has_value());
    ASSERT_EQ(pieces.value().size(), 5u);
    provider_->rejectItem(pieces.value()[1]);

    tests::ScriptedFetcher fetcher;
    fetcher.addPage({rawMessage("long", body)});
    auto report = run(fetcher);

    EXPECT_EQ(report.finalStatus, sync::SyncStatus::Idle);
    EXPECT_EQ(report.inserted, 1u);
    EXPECT_EQ(report.chunksWritten, 5u);
    EXPECT_EQ(report.chunksEmbedded, 4u);
    EXPECT_EQ(report.chunksPending, 1u);
    EXPECT_EQ(report.itemsRejected, 1u);
    EXPECT_EQ(pending(), 1);
    EXPECT_EQ(indexed(), 4u);

    auto stored = repo_->findMessageByExternalId(*owner_, "long").value();
    ASSERT_TRUE(stored.has_value());
    auto rows = repo_->getChunksForMessage(*owner_, stored->id).value();
    ASSERT_EQ(rows.size(), 5u);
    EXPECT_FALSE(rows[1].embedding.has_value());
    ASSERT_TRUE(rows[1].embedError.has_value());
    EXPECT_NE(rows[1].embedError->find("Rejected"), std::string::npos);
    EXPECT_TRUE(rows[0].embedding.has_value());
    EXPECT_FALSE(rows[0].embedError.has_value());
    EXPECT_EQ(rows[1].content, pieces.value()[1]);

    // Rejected text is not queued for re-embedding.
    EXPECT_TRUE(repo_->listPendingChunks(*owner_, 10).value().empty());
}

TEST_F(IngestionPipelineTest, ProviderOutageStoresPendingThenRecovers) {
    provider_->setUnavailable(true);
    tests::ScriptedFetcher fetcher;
    fetcher.addPage({rawMessage("m1", "first message"), rawMessage("m2", "second message")});

    auto report = run(fetcher);
    EXPECT_EQ(report.finalStatus, sync::SyncStatus::Idle);
    EXPECT_EQ(report.inserted, 2u);
    EXPECT_EQ(report.chunksPending, 2u);
    EXPECT_EQ(report.chunksEmbedded, 0u);
    EXPECT_EQ(pending(), 2);
    EXPECT_EQ(indexed(), 0u);

    provider_->setUnavailable(false);
    auto next = run(fetcher);
    EXPECT_EQ(next.finalStatus, sync::SyncStatus::Idle);
    EXPECT_EQ(next.pendingRecovered, 2u);
    EXPECT_EQ(pending(), 0);
    EXPECT_EQ(indexed(), 2u);

    auto hits = index_->search(*owner_, provider_->vectorFor("first message"), 1, 0.99f);
    ASSERT_TRUE(hits.has_value());
    ASSERT_EQ(hits.value().size(), 1u);
}

TEST_F(IngestionPipelineTest, RecoverPendingIsBounded) {
    provider_->setUnavailable(true);
    tests::ScriptedFetcher fetcher;
    std::vector<RawMessage> page;
    for (int i = 0; i < 5; ++i) {
        page.push_back(rawMessage("m" + std::to_string(i), "body " + std::to_string(i)));
    }
    fetcher.addPage(page);
    run(fetcher);
    ASSERT_EQ(pending(), 5);

    provider_->setUnavailable(false);
    PipelineConfig config;
    config.pending_batch_limit = 3;
    IngestionPipeline bounded(*repo_, *tracker_, *index_, *gateway_,
                              chunking::TextChunker(chunkerConfig_), config);
    auto recovered = bounded.recoverPending(*owner_);
    ASSERT_TRUE(recovered.has_value()) << recovered.error().message;
    EXPECT_EQ(recovered.value(), 3u);
    EXPECT_EQ(pending(), 2);
}

TEST_F(IngestionPipelineTest, PermanentRejectionsLeaveThePendingQueue) {
    provider_->rejectItem("spam one");
    provider_->rejectItem("spam two");
    tests::ScriptedFetcher fetcher;
    fetcher.addPage({rawMessage("m1", "spam one"), rawMessage("m2", "spam two")});
    auto first = run(fetcher);
    EXPECT_EQ(first.itemsRejected, 2u);

    provider_->setUnavailable(true);
    fetcher.addPage({rawMessage("m3", "written during the outage")});
    run(fetcher);
    ASSERT_EQ(pending(), 3);

    // Fewer slots than rejected chunks; the outage chunk still gets one.
    provider_->setUnavailable(false);
    PipelineConfig config;
    config.pending_batch_limit = 2;
    IngestionPipeline bounded(*repo_, *tracker_, *index_, *gateway_,
                              chunking::TextChunker(chunkerConfig_), config);
    auto recovered = bounded.recoverPending(*owner_);
    ASSERT_TRUE(recovered.has_value()) << recovered.error().message;
    EXPECT_EQ(recovered.value(), 1u);
    EXPECT_EQ(pending(), 2);
    EXPECT_EQ(indexed(), 1u);
    EXPECT_EQ(bounded.recoverPending(*owner_).value(), 0u);
}

TEST_F(IngestionPipelineTest, RecoveryMarksChunksTheProviderRejects) {
    provider_->setUnavailable(true);
    tests::ScriptedFetcher fetcher;
    fetcher.addPage({rawMessage("m1", "spam one"), rawMessage("m2", "spam two"),
                     rawMessage("m3", "worth keeping")});
    run(fetcher);
    ASSERT_EQ(pending(), 3);

    provider_->setUnavailable(false);
    provider_->rejectItem("spam one");
    provider_->rejectItem("spam two");
    PipelineConfig config;
    config.pending_batch_limit = 2;
    IngestionPipeline bounded(*repo_, *tracker_, *index_, *gateway_,
                              chunking::TextChunker(chunkerConfig_), config);

    size_t total = 0;
    for (int i = 0; i < 2; ++i) {
        auto recovered = bounded.recoverPending(*owner_);
        ASSERT_TRUE(recovered.has_value()) << recovered.error().message;
        total += recovered.value();
    }
    EXPECT_EQ(total, 1u);
    EXPECT_EQ(pending(), 2);
    EXPECT_TRUE(repo_->listPendingChunks(*owner_, 10).value().empty());

    for (const char* id : {"m1", "m2"}) {
        auto stored = repo_->findMessageByExternalId(*owner_, id).value();
        ASSERT_TRUE(stored.has_value());
        auto rows = repo_->getChunksForMessage(*owner_, stored->id).value();
        ASSERT_EQ(rows.size(), 1u);
        EXPECT_TRUE(rows[0].embedError.has_value()) << id;
    }
}

TEST_F(IngestionPipelineTest, InvalidUtf8InFetchedJsonIsStored) {
    auto raw = rawMessage("m1", "hello");
    raw.metadata = nlohmann::json{{"note", "\xff\xfe bad"}};
    raw.participants = nlohmann::json::array({"alice", "b\xffob"});
    tests::ScriptedFetcher fetcher;
    fetcher.addPage({raw});

    auto report = run(fetcher);
    EXPECT_EQ(report.finalStatus, sync::SyncStatus::Idle) << report.error;
    EXPECT_EQ(report.inserted, 1u);
    EXPECT_EQ(state().status, sync::SyncStatus::Idle);

    auto stored = repo_->findMessageByExternalId(*owner_, "m1").value();
    ASSERT_TRUE(stored.has_value());
    const auto note = stored->metadata.at("note").get<std::string>();
    EXPECT_EQ(note.find('\xff'), std::string::npos);
    EXPECT_NE(note.find(" bad"), std::string::npos);

    // A later run is not blocked.
    fetcher.addPage({rawMessage("m2", "next")});
    EXPECT_EQ(run(fetcher).inserted, 1u);
}

TEST_F(IngestionPipelineTest, ExceptionInsideRunEndsInError) {
    vector::IndexConfig indexConfig;
    indexConfig.dimension = kDim;
    vector::TenantVectorIndex throwingIndex(
        indexConfig, [](const identity::Principal&) -> Result<vector::IndexEntries> {
            throw std::runtime_error("partition store offline");
        });
    IngestionPipeline pipeline(*repo_, *tracker_, throwingIndex, *gateway_,
                               chunking::TextChunker(chunkerConfig_));

    tests::ScriptedFetcher fetcher;
    fetcher.addPage({rawMessage("m1", "hello")});
    auto report = pipeline.runSync(*owner_, "linkedin", fetcher);
    ASSERT_TRUE(report.has_value()) << report.error().message;
    EXPECT_EQ(report.value().finalStatus, sync::SyncStatus::Error);
    EXPECT_NE(report.value().error.find("partition store offline"), std::string::npos);
    EXPECT_FALSE(tracker_->isRunning(*owner_, "linkedin"));

    auto s = state();
    EXPECT_EQ(s.status, sync::SyncStatus::Error);
    EXPECT_NE(s.lastError.find("partition store offline"), std::string::npos);

    // The message committed before the throw; the next run dedups it.
    auto next = run(fetcher);
    EXPECT_EQ(next.finalStatus, sync::SyncStatus::Idle);
    EXPECT_EQ(next.duplicates, 1u);
}

TEST_F(IngestionPipelineTest, FailedCompletionIsRecordedAsError) {
    ASSERT_TRUE(db_.execute("CREATE TRIGGER refuse_idle BEFORE UPDATE ON sync_state "
                            "WHEN NEW.status = 'idle' BEGIN SELECT RAISE(ABORT, 'disk full'); END")
                    .has_value());
    tests::ScriptedFetcher fetcher;
    fetcher.addPage({rawMessage("m1", "hello")});

    auto report = run(fetcher);
    EXPECT_EQ(report.finalStatus, sync::SyncStatus::Error);
    EXPECT_NE(report.error.find("disk full"), std::string::npos);
    EXPECT_FALSE(tracker_->isRunning(*owner_, "linkedin"));

    auto s = state();
    EXPECT_EQ(s.status, sync::SyncStatus::Error);
    EXPECT_NE(s.lastError.find("disk full"), std::string::npos);

    ASSERT_TRUE(db_.execute("DROP TRIGGER refuse_idle").has_value());
    EXPECT_EQ(run(fetcher).finalStatus, sync::SyncStatus::Idle);
}

TEST_F(IngestionPipelineTest, TransientFetchErrorsAreRetried) {
    tests::ScriptedFetcher fetcher;
    fetcher.addPage({rawMessage("m1", "hi")});
    fetcher.failNext(ErrorCode::NetworkError, 2);

    auto report = run(fetcher);
    EXPECT_EQ(report.finalStatus, sync::SyncStatus::Idle);
    EXPECT_EQ(report.inserted, 1u);
    ASSERT_EQ(sleeps_.size(), 2u);
    EXPECT_EQ(sleeps_[0], std::chrono::milliseconds(1));
    EXPECT_EQ(sleeps_[1], std::chrono::milliseconds(2));
}

TEST_F(IngestionPipelineTest, ThrowingFetcherIsTreatedAsUnavailable) {
    tests::ScriptedFetcher fetcher;
    fetcher.addPage({rawMessage("m1", "hi")});
    fetcher.throwNext();

    auto report = run(fetcher);
    EXPECT_EQ(report.finalStatus, sync::SyncStatus::Idle);
    EXPECT_EQ(report.inserted, 1u);
    EXPECT_EQ(fetcher.cursorsSeen().size(), 2u);
}

TEST_F(IngestionPipelineTest, ExhaustedFetchFailsRunAndKeepsCheckpoint) {
    tests::ScriptedFetcher fetcher;
    fetcher.addPage({rawMessage("m1", "page zero")});
    fetcher.addPage({rawMessage("m2", "page one")});
    // Page 0 goes through; every attempt at page 1 times out.
    fetcher.onFetch([&](const std::string& cursor) {
        if (cursor.empty()) {
            fetcher.failNext(ErrorCode::Timeout, 3);
        }
    });

    auto report = run(fetcher);
    EXPECT_EQ(report.finalStatus, sync::SyncStatus::Error);
    EXPECT_NE(report.error.find("Fetch failed"), std::string::npos);
    EXPECT_EQ(report.inserted, 1u);

    auto s = state();
    EXPECT_EQ(s.status, sync::SyncStatus::Error);
    EXPECT_EQ(s.cursor, "page-1");
    EXPECT_FALSE(s.lastError.empty());
    EXPECT_FALSE(s.lastSyncedAt.has_value());
    EXPECT_FALSE(tracker_->isRunning(*owner_, "linkedin"));

    // The next run resumes from the checkpoint.
    fetcher.onFetch({});
    auto resumed = run(fetcher);
    EXPECT_EQ(resumed.finalStatus, sync::SyncStatus::Idle);
    EXPECT_EQ(resumed.inserted, 1u);
    EXPECT_EQ(messages(), 2);
    EXPECT_EQ(state().cursor, "page-2");
}

TEST_F(IngestionPipelineTest, PermanentFetchErrorIsNotRetried) {
    tests::ScriptedFetcher fetcher;
    fetcher.addPage({rawMessage("m1", "hi")});
    fetcher.failNext(ErrorCode::PermissionDenied);

    auto report = run(fetcher);
    EXPECT_EQ(report.finalStatus, sync::SyncStatus::Error);
    EXPECT_TRUE(sleeps_.empty());
    EXPECT_EQ(fetcher.cursorsSeen().size(), 1u);
    EXPECT_EQ(state().status, sync::SyncStatus::Error);
}

TEST_F(IngestionPipelineTest, CheckpointsAfterEveryPage) {
    tests::ScriptedFetcher fetcher;
    for (int p = 0; p < 3; ++p) {
        fetcher.addPage({rawMessage("m" + std::to_string(p), "message " + std::to_string(p))});
    }
    std::vector<std::string> persisted;
    fetcher.onFetch([&](const std::string&) { persisted.push_back(state().cursor); });

    auto report = run(fetcher);
    EXPECT_EQ(report.pages, 3u);
    EXPECT_EQ(persisted, (std::vector<std::string>{"", "page-1", "page-2"}));
    EXPECT_EQ(state().cursor, "page-3");
}

TEST_F(IngestionPipelineTest, CancellationStopsBetweenMessages) {
    tests::ScriptedFetcher fetcher;
    fetcher.addPage({rawMessage("m1", "one"), rawMessage("m2", "two")});
    fetcher.addPage({rawMessage("m3", "three"), rawMessage("m4", "four")});
    CancellationToken token;
    fetcher.onFetch([&](const std::string& cursor) {
        if (cursor == "page-1") {
            token.cancel();
        }
    });

    auto report = run(fetcher, &token);
    EXPECT_EQ(report.finalStatus, sync::SyncStatus::Error);
    EXPECT_EQ(report.inserted, 2u);
    EXPECT_EQ(messages(), 2);
    EXPECT_EQ(state().status, sync::SyncStatus::Error);
    EXPECT_EQ(state().cursor, "page-1");
}

TEST_F(IngestionPipelineTest, PreCancelledRunFetchesNothing) {
    tests::ScriptedFetcher fetcher;
    fetcher.addPage({rawMessage("m1", "one")});
    CancellationToken token;
    token.cancel();

    auto report = run(fetcher, &token);
    EXPECT_EQ(report.finalStatus, sync::SyncStatus::Error);
    EXPECT_TRUE(fetcher.cursorsSeen().empty());
    EXPECT_EQ(messages(), 0);
}

TEST_F(IngestionPipelineTest, AlreadyRunningIsRejectedWithoutSideEffects) {
    ASSERT_TRUE(tracker_->begin(*owner_, "linkedin").has_value());
    ASSERT_TRUE(tracker_->checkpoint(*owner_, "linkedin", "page-9").has_value());

    tests::ScriptedFetcher fetcher;
    fetcher.addPage({rawMessage("m1", "one")});
    auto r = pipeline_->runSync(*owner_, "linkedin", fetcher);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::SyncAlreadyRunning);
    EXPECT_TRUE(fetcher.cursorsSeen().empty());
    EXPECT_EQ(state().cursor, "page-9");
    EXPECT_EQ(state().status, sync::SyncStatus::Running);
}

TEST_F(IngestionPipelineTest, StuckCursorFailsTheRun) {
    StuckFetcher fetcher;
    auto report = run(fetcher);
    EXPECT_EQ(report.finalStatus, sync::SyncStatus::Error);
    EXPECT_EQ(state().status, sync::SyncStatus::Error);
}

TEST_F(IngestionPipelineTest, EmptyBodyStoresMessageWithoutChunks) {
    tests::ScriptedFetcher fetcher;
    fetcher.addPage({rawMessage("empty", "")});
    auto report = run(fetcher);
    EXPECT_EQ(report.inserted, 1u);
    EXPECT_EQ(report.chunksWritten, 0u);
    EXPECT_EQ(provider_->calls(), 0u);
}

TEST_F(IngestionPipelineTest, OwnersAreIsolated) {
    auto bob = resolver_.principal("bob");
    ASSERT_TRUE(repo_->ensureProfile(resolver_.identityFor("bob")).has_value());

    tests::ScriptedFetcher fetcher;
    fetcher.addPage({rawMessage("m1", "secret plans")});
    run(fetcher);

    auto bobRun = pipeline_->runSync(bob, "linkedin", fetcher);
    ASSERT_TRUE(bobRun.has_value());
    EXPECT_EQ(bobRun.value().inserted, 1u);
    EXPECT_EQ(bobRun.value().duplicates, 0u);

    auto hits = index_->search(bob, provider_->vectorFor("secret plans"), 10, 0.0f);
    ASSERT_TRUE(hits.has_value());
    ASSERT_EQ(hits.value().size(), 1u);
    auto bobChunks = repo_->getChunks(bob, {hits.value()[0].id}).value();
    ASSERT_EQ(bobChunks.size(), 1u);
    EXPECT_EQ(bobChunks[0].ownerId, "bob");
}
