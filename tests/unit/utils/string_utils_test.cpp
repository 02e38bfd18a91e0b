#include "core/utils/string_utils.h"
#include <gtest/gtest.h>

namespace chat_backup::tests {

using namespace core::utils;

TEST(StringUtilsTest, Join) {
    std::vector<std::string> parts = {"a", "b", "c", "d"};
    auto joined = StringUtils::Join(parts, ",");
    EXPECT_EQ(joined, "a,b,c,d");
}

TEST(StringUtilsTest, JoinEmpty) {
    EXPECT_EQ(StringUtils::Join({}, ","), "");
    EXPECT_EQ(StringUtils::Join({"only"}, ", "), "only");
}

TEST(StringUtilsTest, ToLower) {
    EXPECT_EQ(StringUtils::ToLower("Hello World"), "hello world");
    EXPECT_EQ(StringUtils::ToLower("WARN"), "warn");
}

TEST(StringUtilsTest, Trim) {
    EXPECT_EQ(StringUtils::Trim("  Hello World  "), "Hello World");
    EXPECT_EQ(StringUtils::Trim("\t\r\n"), "");
    EXPECT_EQ(StringUtils::Trim(""), "");
}

TEST(StringUtilsTest, StartsWith) {
    EXPECT_TRUE(StringUtils::StartsWith("postgres://localhost", "postgres://"));
    EXPECT_FALSE(StringUtils::StartsWith("Hello World", "World"));
    EXPECT_FALSE(StringUtils::StartsWith("ab", "abc"));
}

} // namespace chat_backup::tests
