#pragma once

#include <string>

namespace chat_backup::core::utils {

class UuidGenerator {
public:
    // 随机UUID (版本4)，用于恢复时新建的会话、消息和附件
    static std::string GenerateUuid();

    static bool IsValid(const std::string& uuid);
};

} // namespace chat_backup::core::utils
