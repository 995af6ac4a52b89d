#include <gtest/gtest.h>
#include <murmur/config/config_helpers.h>
#include <murmur/config/engine_config.h>

#include "../../common/test_helpers.h"

#include <cstdlib>

using namespace murmur;
using namespace murmur::config;

class EngineConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = tests::make_temp_dir("murmur_config_");
        for (const char* name : {"MURMUR_CONFIG", "MURMUR_DB_PATH", "MURMUR_LOG_LEVEL",
                                 "MURMUR_EMBEDDING_DIM"}) {
            ::unsetenv(name);
        }
    }

    void TearDown() override {
        for (const char* name : {"MURMUR_CONFIG", "MURMUR_DB_PATH", "MURMUR_LOG_LEVEL",
                                 "MURMUR_EMBEDDING_DIM"}) {
            ::unsetenv(name);
        }
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path dir_;
};

TEST_F(EngineConfigTest, ParsesSectionsCommentsAndQuotes) {
    auto path = tests::write_file(dir_ / "config.toml", R"(# top comment
[database]
path = "/tmp/murmur/test.db"

[search]
default_k = 5   # inline comment
default_threshold = 0.55

[logging]
level = 'debug'
)");
    auto values = parse_config_file(path);
    ASSERT_TRUE(values.has_value()) << values.error().message;
    const auto& map = values.value();
    EXPECT_EQ(map.at("database.path"), "/tmp/murmur/test.db");
    EXPECT_EQ(map.at("search.default_k"), "5");
    EXPECT_EQ(map.at("search.default_threshold"), "0.55");
    EXPECT_EQ(map.at("logging.level"), "debug");
}

TEST_F(EngineConfigTest, RejectsMalformedLines) {
    auto path = tests::write_file(dir_ / "bad.toml", "[search\ndefault_k = 5\n");
    auto values = parse_config_file(path);
    ASSERT_FALSE(values);
    EXPECT_EQ(values.error().code, ErrorCode::ConfigurationError);

    path = tests::write_file(dir_ / "bad2.toml", "[search]\ndefault_k\n");
    values = parse_config_file(path);
    ASSERT_FALSE(values);
    EXPECT_EQ(values.error().code, ErrorCode::ConfigurationError);
}

TEST_F(EngineConfigTest, TypedLookups) {
    ConfigMap map{{"a", "12"}, {"b", "1.5"}, {"c", "yes"}, {"d", "12abc"}};
    EXPECT_EQ(*lookup_int(map, "a").value(), 12);
    EXPECT_DOUBLE_EQ(*lookup_double(map, "b").value(), 1.5);
    EXPECT_TRUE(*lookup_bool(map, "c").value());
    EXPECT_FALSE(lookup_int(map, "missing").value().has_value());

    auto bad = lookup_int(map, "d");
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().code, ErrorCode::ConfigurationError);
}

TEST_F(EngineConfigTest, DefaultsAreValid) {
    EngineConfig config;
    auto valid = config.validate();
    EXPECT_TRUE(valid.has_value()) << valid.error().message;
    EXPECT_EQ(config.chunking.max_chunk_chars, 1000u);
    EXPECT_EQ(config.chunking.overlap_chars, 200u);
    EXPECT_EQ(config.search.default_k, 10u);
    EXPECT_FLOAT_EQ(config.search.default_threshold, 0.7f);
    EXPECT_EQ(config.embedding.dimension, 1536u);
}

TEST_F(EngineConfigTest, ApplyOverridesAndKeepsIndexDimensionInStep) {
    EngineConfig config;
    ConfigMap values{{"embedding.dimension", "384"},
                     {"embedding.initial_backoff_ms", "50"},
                     {"chunking.max_chunk_chars", "500"},
                     {"chunking.overlap_chars", "50"},
                     {"index.ivf_nlist", "16"},
                     {"index.ivf_nprobe", "4"},
                     {"sync.worker_threads", "2"},
                     {"search.default_threshold", "0.5"}};
    auto applied = config.apply(values);
    ASSERT_TRUE(applied.has_value()) << applied.error().message;

    EXPECT_EQ(config.embedding.dimension, 384u);
    EXPECT_EQ(config.index.dimension, 384u);
    EXPECT_EQ(config.embedding.initial_backoff.count(), 50);
    EXPECT_EQ(config.chunking.max_chunk_chars, 500u);
    EXPECT_EQ(config.index.ivf_nlist, 16u);
    EXPECT_EQ(config.worker_threads, 2u);
    EXPECT_FLOAT_EQ(config.search.default_threshold, 0.5f);
    EXPECT_TRUE(config.validate().has_value());
}

TEST_F(EngineConfigTest, ApplyRejectsNegativeSizes) {
    EngineConfig config;
    auto applied = config.apply(ConfigMap{{"embedding.batch_size", "-4"}});
    ASSERT_FALSE(applied);
    EXPECT_EQ(applied.error().code, ErrorCode::ConfigurationError);
}

TEST_F(EngineConfigTest, ValidateNamesInvalidSettings) {
    EngineConfig config;
    config.chunking.overlap_chars = config.chunking.max_chunk_chars;
    EXPECT_EQ(config.validate().error().code, ErrorCode::ConfigurationError);

    config = EngineConfig{};
    config.index.dimension = 8;
    EXPECT_EQ(config.validate().error().code, ErrorCode::ConfigurationError);

    config = EngineConfig{};
    config.search.default_threshold = 1.5f;
    EXPECT_EQ(config.validate().error().code, ErrorCode::ConfigurationError);

    config = EngineConfig{};
    config.index.ivf_nprobe = config.index.ivf_nlist + 1;
    EXPECT_EQ(config.validate().error().code, ErrorCode::ConfigurationError);

    config = EngineConfig{};
    config.sync.fetch_max_attempts = 0;
    EXPECT_EQ(config.validate().error().code, ErrorCode::ConfigurationError);
}

TEST_F(EngineConfigTest, LoadAppliesFileThenEnvironment) {
    auto path = tests::write_file(dir_ / "config.toml", R"([database]
path = "/tmp/from-file.db"
[embedding]
dimension = 64
[logging]
level = "debug"
)");
    ::setenv("MURMUR_LOG_LEVEL", "error", 1);

    auto loaded = EngineConfig::load(path);
    ASSERT_TRUE(loaded.has_value()) << loaded.error().message;
    EXPECT_EQ(loaded.value().database_path, "/tmp/from-file.db");
    EXPECT_EQ(loaded.value().embedding.dimension, 64u);
    EXPECT_EQ(loaded.value().index.dimension, 64u);
    EXPECT_EQ(loaded.value().logging.level, "error");
}

TEST_F(EngineConfigTest, EnvironmentOverridesDimensionAndDatabase) {
    ::setenv("MURMUR_EMBEDDING_DIM", "32", 1);
    ::setenv("MURMUR_DB_PATH", ":memory:", 1);

    EngineConfig config;
    auto applied = config.applyEnvironment();
    ASSERT_TRUE(applied.has_value()) << applied.error().message;
    EXPECT_EQ(config.embedding.dimension, 32u);
    EXPECT_EQ(config.index.dimension, 32u);
    EXPECT_EQ(config.resolvedDatabasePath(), ":memory:");

    ::setenv("MURMUR_EMBEDDING_DIM", "many", 1);
    EXPECT_EQ(config.applyEnvironment().error().code, ErrorCode::ConfigurationError);
}

TEST_F(EngineConfigTest, ExplicitPathMustExist) {
    auto loaded = EngineConfig::load(dir_ / "nope.toml");
    ASSERT_FALSE(loaded);
    EXPECT_EQ(loaded.error().code, ErrorCode::NotFound);

    ::setenv("MURMUR_CONFIG", (dir_ / "also-missing.toml").c_str(), 1);
    loaded = EngineConfig::load();
    ASSERT_FALSE(loaded);
    EXPECT_EQ(loaded.error().code, ErrorCode::NotFound);
}

TEST_F(EngineConfigTest, DefaultDatabaseLivesInDataDir) {
    EngineConfig config;
    auto path = std::filesystem::path(config.resolvedDatabasePath());
    EXPECT_EQ(path.filename(), "murmur.db");
    EXPECT_EQ(path.parent_path(), get_data_dir());
}
