#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

#include "models/identifiers.h"
#include "models/interaction.h"

namespace chat_backup::models {

struct BackupAttachment {
    std::string content_type;
    std::string file_name;
    uint64_t size_bytes = 0;

    bool operator==(const BackupAttachment&) const = default;
};

struct BackupReaction {
    RecipientId author_id;
    std::string emoji;
    uint64_t sent_timestamp = 0;
    uint64_t sort_order = 0;

    bool operator==(const BackupReaction&) const = default;
};

// 备份记录的消息体，每种类型对应一种聊天记录

struct StandardMessage {
    std::string text;
    std::vector<BackupAttachment> attachments;
    std::vector<BackupReaction> reactions;

    bool operator==(const StandardMessage&) const = default;
};

struct ContactMessage {
    std::string name;
    std::vector<std::string> phone_numbers;
    std::vector<BackupReaction> reactions;

    bool operator==(const ContactMessage&) const = default;
};

struct VoiceMessage {
    BackupAttachment audio;
    std::vector<BackupReaction> reactions;

    bool operator==(const VoiceMessage&) const = default;
};

struct StickerMessage {
    std::string pack_id;
    std::string pack_key;
    uint32_t sticker_id = 0;
    std::string emoji;
    std::vector<BackupReaction> reactions;

    bool operator==(const StickerMessage&) const = default;
};

struct RemoteDeletedMessage {
    bool operator==(const RemoteDeletedMessage&) const = default;
};

struct ChatUpdateMessage {
    InfoMessageType update_type = InfoMessageType::kUnknown;
    std::string detail;

    bool operator==(const ChatUpdateMessage&) const = default;
};

using ChatItemPayload = std::variant<
    StandardMessage,
    ContactMessage,
    VoiceMessage,
    StickerMessage,
    RemoteDeletedMessage,
    ChatUpdateMessage>;

// 方向信息：接收、发送或无方向（如会话更新）

struct IncomingMessageDetails {
    uint64_t date_received = 0;
    bool read = false;

    bool operator==(const IncomingMessageDetails&) const = default;
};

struct SendStatus {
    RecipientId recipient_id;
    DeliveryStatus status = DeliveryStatus::kPending;
    uint64_t last_status_update = 0;

    bool operator==(const SendStatus&) const = default;
};

struct OutgoingMessageDetails {
    std::vector<SendStatus> send_status;

    bool operator==(const OutgoingMessageDetails&) const = default;
};

struct DirectionlessMessageDetails {
    bool operator==(const DirectionlessMessageDetails&) const = default;
};

// 默认构造为无方向
using DirectionalDetails = std::variant<
    DirectionlessMessageDetails,
    IncomingMessageDetails,
    OutgoingMessageDetails>;

// 单条消息在备份中的表示，组装完成后不再修改
struct ChatItem {
    ChatId chat_id;
    RecipientId author_id;
    uint64_t date_sent = 0;
    bool sealed_sender = false;
    bool sms = false;
    std::optional<uint64_t> expire_start_date;
    std::optional<uint64_t> expires_in_ms;
    DirectionalDetails directional_details;
    ChatItemPayload payload;
    std::vector<ChatItem> revisions;

    ChatItemId Id() const { return ChatItemId{date_sent}; }

    nlohmann::json ToJson() const;
    static ChatItem FromJson(const nlohmann::json& json);
};

bool IsMessagePayload(const ChatItemPayload& payload);

} // namespace chat_backup::models
