#include <gtest/gtest.h>
#include <murmur/core/types.h>

#include <string>
#include <vector>

using namespace murmur;

TEST(ResultTest, CarriesValue) {
    Result<int> r(7);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r.value(), 7);
    EXPECT_THROW((void)r.error(), std::logic_error);
}

TEST(ResultTest, CarriesError) {
    Result<std::string> r(Error{ErrorCode::NotFound, "missing"});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::NotFound);
    EXPECT_EQ(r.error().message, "missing");
    EXPECT_THROW((void)r.value(), std::logic_error);
}

TEST(ResultTest, ErrorCodeOnlyUsesDefaultMessage) {
    Result<void> r(ErrorCode::SyncAlreadyRunning);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().message, "Sync already running");
}

TEST(ResultTest, MovesValueOut) {
    Result<std::vector<int>> r(std::vector<int>{1, 2, 3});
    auto v = std::move(r).value();
    EXPECT_EQ(v.size(), 3u);
}

TEST(ErrorCodeTest, TransientClassification) {
    EXPECT_TRUE(isTransient(ErrorCode::ProviderUnavailable));
    EXPECT_TRUE(isTransient(ErrorCode::Timeout));
    EXPECT_TRUE(isTransient(ErrorCode::NetworkError));
    EXPECT_TRUE(isTransient(ErrorCode::ResourceExhausted));

    EXPECT_FALSE(isTransient(ErrorCode::InvalidInput));
    EXPECT_FALSE(isTransient(ErrorCode::DimensionMismatch));
    EXPECT_FALSE(isTransient(ErrorCode::PermissionDenied));
    EXPECT_FALSE(isTransient(ErrorCode::DatabaseError));
}
