#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "models/identifiers.h"

namespace chat_backup::models {

enum class InteractionKind {
    kIncomingMessage,
    kOutgoingMessage,
    kInfoMessage,
    kErrorMessage,
    kCall,
    kStoryMessage,
    kUnknown
};

enum class EditState {
    kNone,
    kLatestRevision,
    kPastRevision
};

enum class InfoMessageType {
    kGroupUpdate,
    kDisappearingTimerChanged,
    kSafetyNumberChanged,
    kProfileChanged,
    kUnknown
};

enum class DeliveryStatus {
    kPending,
    kSent,
    kDelivered,
    kRead,
    kFailed
};

struct Attachment {
    std::string id;
    std::string content_type;
    std::string file_name;
    uint64_t size_bytes = 0;

    nlohmann::json ToJson() const;
    static Attachment FromJson(const nlohmann::json& json);
};

struct StickerInfo {
    std::string pack_id;
    std::string pack_key;
    uint32_t sticker_id = 0;
    std::string emoji;

    nlohmann::json ToJson() const;
    static StickerInfo FromJson(const nlohmann::json& json);
};

struct ContactShare {
    std::string name;
    std::vector<std::string> phone_numbers;

    nlohmann::json ToJson() const;
    static ContactShare FromJson(const nlohmann::json& json);
};

// 外发消息对单个接收者的投递状态
struct OutgoingRecipientState {
    std::string address;
    DeliveryStatus status = DeliveryStatus::kPending;
    uint64_t updated_at = 0;

    nlohmann::json ToJson() const;
    static OutgoingRecipientState FromJson(const nlohmann::json& json);
};

// 本地的一条聊天消息或事件，归档器只读
struct Interaction {
    std::string unique_id;
    std::string unique_thread_id;
    uint64_t timestamp = 0;
    uint64_t received_at_timestamp = 0;
    InteractionKind kind = InteractionKind::kUnknown;

    // 仅接收消息有作者地址
    std::string author_address;

    std::string body;
    std::vector<Attachment> attachments;
    std::optional<StickerInfo> sticker;
    std::optional<ContactShare> contact_share;
    bool is_voice_message = false;
    bool was_remotely_deleted = false;
    bool was_read = false;
    bool was_received_by_ud = false;
    bool is_sms = false;

    // 0 表示计时尚未开始
    uint64_t expire_started_at = 0;
    uint32_t expires_in_seconds = 0;

    EditState edit_state = EditState::kNone;
    std::string latest_revision_id;

    InfoMessageType info_type = InfoMessageType::kUnknown;
    std::string info_detail;

    std::vector<OutgoingRecipientState> recipient_states;

    ChatItemId ChatItemIdentifier() const { return ChatItemId{timestamp}; }
};

std::string ToString(InteractionKind kind);
InteractionKind InteractionKindFromString(const std::string& value);
std::string ToString(EditState state);
EditState EditStateFromString(const std::string& value);
std::string ToString(InfoMessageType type);
InfoMessageType InfoMessageTypeFromString(const std::string& value);
std::string ToString(DeliveryStatus status);
DeliveryStatus DeliveryStatusFromString(const std::string& value);

} // namespace chat_backup::models
