#include "models/interaction.h"

namespace chat_backup::models {

nlohmann::json Attachment::ToJson() const {
    nlohmann::json json_obj;

    json_obj["id"] = id;
    json_obj["content_type"] = content_type;
    json_obj["file_name"] = file_name;
    json_obj["size_bytes"] = size_bytes;

    return json_obj;
}

Attachment Attachment::FromJson(const nlohmann::json& json) {
    Attachment attachment;

    if (json.contains("id") && json["id"].is_string()) {
        attachment.id = json["id"].get<std::string>();
    }

    if (json.contains("content_type") && json["content_type"].is_string()) {
        attachment.content_type = json["content_type"].get<std::string>();
    }

    if (json.contains("file_name") && json["file_name"].is_string()) {
        attachment.file_name = json["file_name"].get<std::string>();
    }

    if (json.contains("size_bytes") && json["size_bytes"].is_number_unsigned()) {
        attachment.size_bytes = json["size_bytes"].get<uint64_t>();
    }

    return attachment;
}

nlohmann::json StickerInfo::ToJson() const {
    return {
        {"pack_id", pack_id},
        {"pack_key", pack_key},
        {"sticker_id", sticker_id},
        {"emoji", emoji}
    };
}

StickerInfo StickerInfo::FromJson(const nlohmann::json& json) {
    StickerInfo sticker;
    sticker.pack_id = json.value("pack_id", "");
    sticker.pack_key = json.value("pack_key", "");
    sticker.sticker_id = json.value("sticker_id", 0u);
    sticker.emoji = json.value("emoji", "");
    return sticker;
}

nlohmann::json ContactShare::ToJson() const {
    return {
        {"name", name},
        {"phone_numbers", phone_numbers}
    };
}

ContactShare ContactShare::FromJson(const nlohmann::json& json) {
    ContactShare contact;
    contact.name = json.value("name", "");

    if (json.contains("phone_numbers") && json["phone_numbers"].is_array()) {
        for (const auto& number : json["phone_numbers"]) {
            if (number.is_string()) {
                contact.phone_numbers.push_back(number.get<std::string>());
            }
        }
    }

    return contact;
}

nlohmann::json OutgoingRecipientState::ToJson() const {
    return {
        {"address", address},
        {"status", ToString(status)},
        {"updated_at", updated_at}
    };
}

OutgoingRecipientState OutgoingRecipientState::FromJson(const nlohmann::json& json) {
    OutgoingRecipientState state;
    state.address = json.value("address", "");
    state.status = DeliveryStatusFromString(json.value("status", "pending"));
    state.updated_at = json.value("updated_at", uint64_t{0});
    return state;
}

std::string ToString(InteractionKind kind) {
    switch (kind) {
        case InteractionKind::kIncomingMessage: return "incoming_message";
        case InteractionKind::kOutgoingMessage: return "outgoing_message";
        case InteractionKind::kInfoMessage: return "info_message";
        case InteractionKind::kErrorMessage: return "error_message";
        case InteractionKind::kCall: return "call";
        case InteractionKind::kStoryMessage: return "story_message";
        case InteractionKind::kUnknown: break;
    }
    return "unknown";
}

InteractionKind InteractionKindFromString(const std::string& value) {
    if (value == "incoming_message") return InteractionKind::kIncomingMessage;
    if (value == "outgoing_message") return InteractionKind::kOutgoingMessage;
    if (value == "info_message") return InteractionKind::kInfoMessage;
    if (value == "error_message") return InteractionKind::kErrorMessage;
    if (value == "call") return InteractionKind::kCall;
    if (value == "story_message") return InteractionKind::kStoryMessage;
    return InteractionKind::kUnknown;
}

std::string ToString(EditState state) {
    switch (state) {
        case EditState::kLatestRevision: return "latest_revision";
        case EditState::kPastRevision: return "past_revision";
        case EditState::kNone: break;
    }
    return "none";
}

EditState EditStateFromString(const std::string& value) {
    if (value == "latest_revision") return EditState::kLatestRevision;
    if (value == "past_revision") return EditState::kPastRevision;
    return EditState::kNone;
}

std::string ToString(InfoMessageType type) {
    switch (type) {
        case InfoMessageType::kGroupUpdate: return "group_update";
        case InfoMessageType::kDisappearingTimerChanged: return "disappearing_timer_changed";
        case InfoMessageType::kSafetyNumberChanged: return "safety_number_changed";
        case InfoMessageType::kProfileChanged: return "profile_changed";
        case InfoMessageType::kUnknown: break;
    }
    return "unknown";
}

InfoMessageType InfoMessageTypeFromString(const std::string& value) {
    if (value == "group_update") return InfoMessageType::kGroupUpdate;
    if (value == "disappearing_timer_changed") return InfoMessageType::kDisappearingTimerChanged;
    if (value == "safety_number_changed") return InfoMessageType::kSafetyNumberChanged;
    if (value == "profile_changed") return InfoMessageType::kProfileChanged;
    return InfoMessageType::kUnknown;
}

std::string ToString(DeliveryStatus status) {
    switch (status) {
        case DeliveryStatus::kPending: return "pending";
        case DeliveryStatus::kSent: return "sent";
        case DeliveryStatus::kDelivered: return "delivered";
        case DeliveryStatus::kRead: return "read";
        case DeliveryStatus::kFailed: return "failed";
    }
    return "pending";
}

DeliveryStatus DeliveryStatusFromString(const std::string& value) {
    if (value == "sent") return DeliveryStatus::kSent;
    if (value == "delivered") return DeliveryStatus::kDelivered;
    if (value == "read") return DeliveryStatus::kRead;
    if (value == "failed") return DeliveryStatus::kFailed;
    return DeliveryStatus::kPending;
}

} // namespace chat_backup::models
