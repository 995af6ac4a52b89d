#include <gtest/gtest.h>
#include <murmur/core/uuid.h>

#include <regex>
#include <set>

using murmur::core::generateUUID;

TEST(UuidTest, HasVersion4Layout) {
    static const std::regex pattern(
        "^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");
    for (int i = 0; i < 100; ++i) {
        auto id = generateUUID();
        EXPECT_TRUE(std::regex_match(id, pattern)) << id;
    }
}

TEST(UuidTest, DoesNotRepeat) {
    std::set<std::string> seen;
    for (int i = 0; i < 10000; ++i) {
        EXPECT_TRUE(seen.insert(generateUUID()).second);
    }
}
