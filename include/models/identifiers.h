#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace chat_backup::models {

// 本地会话的稳定标识符
struct ThreadUniqueId {
    std::string value;

    bool operator==(const ThreadUniqueId&) const = default;
    std::string ToString() const { return "thread:" + value; }
};

// 备份中的会话标识符，每次导出时为每个会话生成一次
struct ChatId {
    uint64_t value = 0;

    bool operator==(const ChatId&) const = default;
    std::string ToString() const { return "chat:" + std::to_string(value); }
};

// 备份中的联系人标识符
struct RecipientId {
    uint64_t value = 0;

    bool operator==(const RecipientId&) const = default;
    std::string ToString() const { return "recipient:" + std::to_string(value); }
};

// 聊天记录标识符，取自消息发送时间戳
struct ChatItemId {
    uint64_t value = 0;

    bool operator==(const ChatItemId&) const = default;
    std::string ToString() const { return "chat_item:" + std::to_string(value); }
};

} // namespace chat_backup::models

template <>
struct std::hash<chat_backup::models::ThreadUniqueId> {
    size_t operator()(const chat_backup::models::ThreadUniqueId& id) const noexcept {
        return std::hash<std::string>{}(id.value);
    }
};

template <>
struct std::hash<chat_backup::models::ChatId> {
    size_t operator()(const chat_backup::models::ChatId& id) const noexcept {
        return std::hash<uint64_t>{}(id.value);
    }
};

template <>
struct std::hash<chat_backup::models::RecipientId> {
    size_t operator()(const chat_backup::models::RecipientId& id) const noexcept {
        return std::hash<uint64_t>{}(id.value);
    }
};
