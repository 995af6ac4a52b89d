#include <gtest/gtest.h>
#include <murmur/vector/vector_index.h>

#include "../../common/test_helpers.h"

#include <cmath>
#include <random>

using namespace murmur;
using namespace murmur::vector;
using murmur::tests::axisVector;

class VectorIndexTest : public ::testing::TestWithParam<IndexType> {
protected:
    void SetUp() override {
        config_.dimension = 8;
        config_.ivf_nlist = 4;
        config_.ivf_nprobe = 4;
        index_ = createVectorIndex(GetParam(), config_);
        ASSERT_NE(index_, nullptr);
    }

    IndexConfig config_;
    std::unique_ptr<VectorIndex> index_;
};

TEST_P(VectorIndexTest, ExactMatchPassesThresholdOne) {
    auto v = axisVector(8, 2, 0.3f);
    ASSERT_TRUE(index_->upsert("a", v).has_value());
    ASSERT_TRUE(index_->upsert("b", axisVector(8, 5)).has_value());

    auto r = index_->search(v, 10, 1.0f);
    ASSERT_TRUE(r.has_value()) << r.error().message;
    ASSERT_EQ(r.value().size(), 1u);
    EXPECT_EQ(r.value()[0].id, "a");
    EXPECT_LE(r.value()[0].similarity, 1.0f);
    EXPECT_NEAR(r.value()[0].similarity, 1.0f, 1e-5f);
}

TEST_P(VectorIndexTest, ThresholdIsAppliedExactly) {
    auto query = axisVector(8, 0);
    ASSERT_TRUE(index_->upsert("a", axisVector(8, 0, 0.5f)).has_value());

    auto all = index_->search(query, 10, -1.0f);
    ASSERT_TRUE(all.has_value()) << all.error().message;
    ASSERT_EQ(all.value().size(), 1u);
    const float sim = all.value()[0].similarity;
    EXPECT_LT(sim, 0.99f);

    // Just above the score: excluded, not rescued by rounding slack.
    auto above = index_->search(query, 10, std::nextafter(sim, 2.0f));
    ASSERT_TRUE(above.has_value()) << above.error().message;
    EXPECT_TRUE(above.value().empty());

    auto at = index_->search(query, 10, sim);
    ASSERT_TRUE(at.has_value()) << at.error().message;
    ASSERT_EQ(at.value().size(), 1u);
    EXPECT_GE(at.value()[0].similarity, sim);
}

TEST_P(VectorIndexTest, OrdersBySimilarityThenId) {
    auto query = axisVector(8, 0);
    ASSERT_TRUE(index_->upsert("far", axisVector(8, 0, 2.0f)).has_value());
    ASSERT_TRUE(index_->upsert("near", axisVector(8, 0, 0.1f)).has_value());
    // Same direction as "tie-a", so identical similarity.
    ASSERT_TRUE(index_->upsert("tie-b", axisVector(8, 0, 0.5f)).has_value());
    ASSERT_TRUE(index_->upsert("tie-a", axisVector(8, 0, 0.5f)).has_value());

    auto r = index_->search(query, 10, -1.0f);
    ASSERT_TRUE(r.has_value()) << r.error().message;
    ASSERT_EQ(r.value().size(), 4u);
    EXPECT_EQ(r.value()[0].id, "near");
    EXPECT_EQ(r.value()[1].id, "tie-a");
    EXPECT_EQ(r.value()[2].id, "tie-b");
    EXPECT_EQ(r.value()[3].id, "far");
    EXPECT_FLOAT_EQ(r.value()[1].similarity, r.value()[2].similarity);
}

TEST_P(VectorIndexTest, RespectsKAndThreshold) {
    for (size_t i = 0; i < 8; ++i) {
        ASSERT_TRUE(index_->upsert("v" + std::to_string(i), axisVector(8, i)).has_value());
    }
    auto query = axisVector(8, 3, 0.2f);

    auto top2 = index_->search(query, 2, -1.0f);
    ASSERT_TRUE(top2.has_value());
    ASSERT_EQ(top2.value().size(), 2u);
    EXPECT_EQ(top2.value()[0].id, "v3");
    EXPECT_EQ(top2.value()[1].id, "v4");

    auto strict = index_->search(query, 10, 0.5f);
    ASSERT_TRUE(strict.has_value());
    ASSERT_EQ(strict.value().size(), 1u);
    EXPECT_EQ(strict.value()[0].id, "v3");
}

TEST_P(VectorIndexTest, UpsertReplacesExistingVector) {
    ASSERT_TRUE(index_->upsert("x", axisVector(8, 1)).has_value());
    ASSERT_TRUE(index_->upsert("x", axisVector(8, 6)).has_value());
    EXPECT_EQ(index_->size(), 1u);

    auto r = index_->search(axisVector(8, 6), 1, 0.9f);
    ASSERT_TRUE(r.has_value());
    ASSERT_EQ(r.value().size(), 1u);
    EXPECT_EQ(r.value()[0].id, "x");
}

TEST_P(VectorIndexTest, RemoveIsIdempotent) {
    for (size_t i = 0; i < 6; ++i) {
        ASSERT_TRUE(index_->upsert("v" + std::to_string(i), axisVector(8, i)).has_value());
    }
    EXPECT_TRUE(index_->remove("v2"));
    EXPECT_FALSE(index_->remove("v2"));
    EXPECT_FALSE(index_->contains("v2"));
    EXPECT_EQ(index_->size(), 5u);

    auto r = index_->search(axisVector(8, 2), 10, 0.9f);
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(r.value().empty());

    // The slot moved into v2's place is still found.
    auto moved = index_->search(axisVector(8, 5), 1, 0.9f);
    ASSERT_TRUE(moved.has_value());
    ASSERT_EQ(moved.value().size(), 1u);
    EXPECT_EQ(moved.value()[0].id, "v5");
}

TEST_P(VectorIndexTest, RejectsWrongDimension) {
    auto up = index_->upsert("bad", std::vector<float>(7, 1.0f));
    ASSERT_FALSE(up);
    EXPECT_EQ(up.error().code, ErrorCode::DimensionMismatch);

    auto search = index_->search(std::vector<float>(9, 1.0f), 5, 0.0f);
    ASSERT_FALSE(search);
    EXPECT_EQ(search.error().code, ErrorCode::DimensionMismatch);
}

TEST_P(VectorIndexTest, EmptyIndexReturnsNothing) {
    auto r = index_->search(axisVector(8, 0), 5, -1.0f);
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(r.value().empty());
}

INSTANTIATE_TEST_SUITE_P(Strategies, VectorIndexTest,
                         ::testing::Values(IndexType::FLAT, IndexType::IVF_FLAT),
                         [](const ::testing::TestParamInfo<IndexType>& info) {
                             return std::string(indexTypeName(info.param));
                         });

TEST(IvfFlatIndexTest, FullProbeMatchesExactSearch) {
    IndexConfig config;
    config.dimension = 16;
    config.ivf_nlist = 8;
    config.ivf_nprobe = 8;

    std::mt19937 gen(7);
    std::normal_distribution<float> dist(0.0f, 1.0f);
    std::vector<std::pair<std::string, std::vector<float>>> entries;
    for (int i = 0; i < 200; ++i) {
        std::vector<float> v(16);
        for (auto& x : v)
            x = dist(gen);
        entries.emplace_back("id" + std::to_string(i), v);
    }

    auto flat = createVectorIndex(IndexType::FLAT, config, entries);
    auto ivf = createVectorIndex(IndexType::IVF_FLAT, config, entries);
    ASSERT_EQ(ivf->size(), 200u);

    for (int q = 0; q < 10; ++q) {
        std::vector<float> query(16);
        for (auto& x : query)
            x = dist(gen);
        auto expected = flat->search(query, 5, -1.0f);
        auto actual = ivf->search(query, 5, -1.0f);
        ASSERT_TRUE(expected.has_value());
        ASSERT_TRUE(actual.has_value());
        ASSERT_EQ(expected.value().size(), actual.value().size());
        for (size_t i = 0; i < expected.value().size(); ++i) {
            EXPECT_EQ(expected.value()[i].id, actual.value()[i].id);
        }
    }
}

TEST(IvfFlatIndexTest, PartialProbeFindsOwnVector) {
    IndexConfig config;
    config.dimension = 16;
    config.ivf_nlist = 10;
    config.ivf_nprobe = 2;

    std::mt19937 gen(11);
    std::normal_distribution<float> dist(0.0f, 1.0f);
    std::vector<std::pair<std::string, std::vector<float>>> entries;
    for (int i = 0; i < 300; ++i) {
        std::vector<float> v(16);
        for (auto& x : v)
            x = dist(gen);
        entries.emplace_back("id" + std::to_string(i), v);
    }
    auto ivf = createVectorIndex(IndexType::IVF_FLAT, config, entries);

    // A stored vector is always in the list of its nearest centroid.
    for (int i = 0; i < 300; i += 17) {
        auto r = ivf->search(entries[i].second, 1, 0.99f);
        ASSERT_TRUE(r.has_value());
        ASSERT_EQ(r.value().size(), 1u) << entries[i].first;
        EXPECT_EQ(r.value()[0].id, entries[i].first);
    }
}

TEST(IndexConfigTest, Validation) {
    IndexConfig config;
    EXPECT_TRUE(validate(config).has_value());

    config.dimension = 0;
    EXPECT_EQ(validate(config).error().code, ErrorCode::ConfigurationError);

    config = IndexConfig{};
    config.ivf_nprobe = 0;
    EXPECT_EQ(validate(config).error().code, ErrorCode::ConfigurationError);

    config = IndexConfig{};
    config.kmeans_iterations = 0;
    EXPECT_EQ(validate(config).error().code, ErrorCode::ConfigurationError);
}

TEST(VectorUtilsTest, CosineSimilarity) {
    std::vector<float> a{1.0f, 0.0f};
    std::vector<float> b{0.0f, 1.0f};
    std::vector<float> c{-2.0f, 0.0f};
    std::vector<float> zero{0.0f, 0.0f};

    EXPECT_FLOAT_EQ(vector_utils::cosineSimilarity(a, a), 1.0f);
    EXPECT_FLOAT_EQ(vector_utils::cosineSimilarity(a, b), 0.0f);
    EXPECT_FLOAT_EQ(vector_utils::cosineSimilarity(a, c), -1.0f);
    EXPECT_FLOAT_EQ(vector_utils::cosineSimilarity(a, zero), 0.0f);
}

TEST(VectorUtilsTest, NormalizeLeavesZeroVectorAlone) {
    auto n = vector_utils::normalize({3.0f, 4.0f});
    EXPECT_FLOAT_EQ(n[0], 0.6f);
    EXPECT_FLOAT_EQ(n[1], 0.8f);

    auto z = vector_utils::normalize({0.0f, 0.0f});
    EXPECT_FLOAT_EQ(z[0], 0.0f);
}
