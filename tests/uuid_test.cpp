#include "core/utils/uuid.h"
#include <gtest/gtest.h>
#include <regex>
#include <unordered_set>

namespace chat_backup::tests {

using namespace core::utils;

TEST(UuidGeneratorTest, GenerateUuid) {
    // 测试生成UUID格式是否正确
    std::string uuid = UuidGenerator::GenerateUuid();
    std::regex uuid_regex("^[0-9a-f]{8}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{12}$",
                          std::regex_constants::icase);
    EXPECT_TRUE(std::regex_match(uuid, uuid_regex));

    // 版本标识为4
    EXPECT_EQ(uuid.substr(14, 1), "4");

    // 变体位为10xx
    const char variant = uuid[19];
    EXPECT_TRUE(variant == '8' || variant == '9' || variant == 'a' || variant == 'b');
}

TEST(UuidGeneratorTest, GeneratedUuidsAreUnique) {
    std::unordered_set<std::string> seen;
    for (int i = 0; i < 1000; ++i) {
        EXPECT_TRUE(seen.insert(UuidGenerator::GenerateUuid()).second);
    }
}

TEST(UuidGeneratorTest, IsValid) {
    // 测试有效UUID
    EXPECT_TRUE(UuidGenerator::IsValid("123e4567-e89b-12d3-a456-426614174000"));
    EXPECT_TRUE(UuidGenerator::IsValid(UuidGenerator::GenerateUuid()));

    // 测试无效UUID
    EXPECT_FALSE(UuidGenerator::IsValid("invalid-uuid"));
    EXPECT_FALSE(UuidGenerator::IsValid("123e4567-e89b-12d3-a456-42661417400")); // 少一位
    EXPECT_FALSE(UuidGenerator::IsValid("123e4567-e89b-12d3-a456-4266141740001")); // 多一位
    EXPECT_FALSE(UuidGenerator::IsValid("123e4567-e89b-12d3-a456_426614174000")); // 格式错误
}

} // namespace chat_backup::tests
