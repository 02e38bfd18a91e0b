#include "models/chat_item.h"

#include <stdexcept>

namespace chat_backup::models {

namespace {

nlohmann::json AttachmentToJson(const BackupAttachment& attachment) {
    return {
        {"content_type", attachment.content_type},
        {"file_name", attachment.file_name},
        {"size_bytes", attachment.size_bytes}
    };
}

BackupAttachment AttachmentFromJson(const nlohmann::json& json) {
    BackupAttachment attachment;
    attachment.content_type = json.value("content_type", "");
    attachment.file_name = json.value("file_name", "");
    attachment.size_bytes = json.value("size_bytes", uint64_t{0});
    return attachment;
}

nlohmann::json ReactionsToJson(const std::vector<BackupReaction>& reactions) {
    nlohmann::json reactions_json = nlohmann::json::array();
    for (const auto& reaction : reactions) {
        reactions_json.push_back({
            {"author_id", reaction.author_id.value},
            {"emoji", reaction.emoji},
            {"sent_timestamp", reaction.sent_timestamp},
            {"sort_order", reaction.sort_order}
        });
    }
    return reactions_json;
}

std::vector<BackupReaction> ReactionsFromJson(const nlohmann::json& json) {
    std::vector<BackupReaction> reactions;
    if (!json.contains("reactions") || !json["reactions"].is_array()) {
        return reactions;
    }

    for (const auto& reaction_json : json["reactions"]) {
        BackupReaction reaction;
        reaction.author_id = RecipientId{reaction_json.at("author_id").get<uint64_t>()};
        reaction.emoji = reaction_json.value("emoji", "");
        reaction.sent_timestamp = reaction_json.value("sent_timestamp", uint64_t{0});
        reaction.sort_order = reaction_json.value("sort_order", uint64_t{0});
        reactions.push_back(std::move(reaction));
    }
    return reactions;
}

nlohmann::json PayloadToJson(const ChatItemPayload& payload) {
    nlohmann::json json_obj;

    if (const auto* standard = std::get_if<StandardMessage>(&payload)) {
        json_obj["type"] = "standard";
        json_obj["text"] = standard->text;
        nlohmann::json attachments_json = nlohmann::json::array();
        for (const auto& attachment : standard->attachments) {
            attachments_json.push_back(AttachmentToJson(attachment));
        }
        json_obj["attachments"] = attachments_json;
        json_obj["reactions"] = ReactionsToJson(standard->reactions);
    } else if (const auto* contact = std::get_if<ContactMessage>(&payload)) {
        json_obj["type"] = "contact";
        json_obj["name"] = contact->name;
        json_obj["phone_numbers"] = contact->phone_numbers;
        json_obj["reactions"] = ReactionsToJson(contact->reactions);
    } else if (const auto* voice = std::get_if<VoiceMessage>(&payload)) {
        json_obj["type"] = "voice";
        json_obj["audio"] = AttachmentToJson(voice->audio);
        json_obj["reactions"] = ReactionsToJson(voice->reactions);
    } else if (const auto* sticker = std::get_if<StickerMessage>(&payload)) {
        json_obj["type"] = "sticker";
        json_obj["pack_id"] = sticker->pack_id;
        json_obj["pack_key"] = sticker->pack_key;
        json_obj["sticker_id"] = sticker->sticker_id;
        json_obj["emoji"] = sticker->emoji;
        json_obj["reactions"] = ReactionsToJson(sticker->reactions);
    } else if (std::holds_alternative<RemoteDeletedMessage>(payload)) {
        json_obj["type"] = "remote_deleted";
    } else if (const auto* update = std::get_if<ChatUpdateMessage>(&payload)) {
        json_obj["type"] = "chat_update";
        json_obj["update_type"] = ToString(update->update_type);
        json_obj["detail"] = update->detail;
    }

    return json_obj;
}

ChatItemPayload PayloadFromJson(const nlohmann::json& json) {
    const std::string type = json.at("type").get<std::string>();

    if (type == "standard") {
        StandardMessage standard;
        standard.text = json.value("text", "");
        if (json.contains("attachments") && json["attachments"].is_array()) {
            for (const auto& attachment_json : json["attachments"]) {
                standard.attachments.push_back(AttachmentFromJson(attachment_json));
            }
        }
        standard.reactions = ReactionsFromJson(json);
        return standard;
    }

    if (type == "contact") {
        ContactMessage contact;
        contact.name = json.value("name", "");
        contact.phone_numbers = json.value("phone_numbers", std::vector<std::string>{});
        contact.reactions = ReactionsFromJson(json);
        return contact;
    }

    if (type == "voice") {
        VoiceMessage voice;
        voice.audio = AttachmentFromJson(json.at("audio"));
        voice.reactions = ReactionsFromJson(json);
        return voice;
    }

    if (type == "sticker") {
        StickerMessage sticker;
        sticker.pack_id = json.value("pack_id", "");
        sticker.pack_key = json.value("pack_key", "");
        sticker.sticker_id = json.value("sticker_id", 0u);
        sticker.emoji = json.value("emoji", "");
        sticker.reactions = ReactionsFromJson(json);
        return sticker;
    }

    if (type == "remote_deleted") {
        return RemoteDeletedMessage{};
    }

    if (type == "chat_update") {
        ChatUpdateMessage update;
        update.update_type = InfoMessageTypeFromString(json.value("update_type", "unknown"));
        update.detail = json.value("detail", "");
        return update;
    }

    throw std::invalid_argument("Unknown chat item payload type: " + type);
}

nlohmann::json DirectionalDetailsToJson(const DirectionalDetails& details) {
    if (const auto* incoming = std::get_if<IncomingMessageDetails>(&details)) {
        return {
            {"direction", "incoming"},
            {"date_received", incoming->date_received},
            {"read", incoming->read}
        };
    }

    if (const auto* outgoing = std::get_if<OutgoingMessageDetails>(&details)) {
        nlohmann::json statuses = nlohmann::json::array();
        for (const auto& status : outgoing->send_status) {
            statuses.push_back({
                {"recipient_id", status.recipient_id.value},
                {"status", ToString(status.status)},
                {"last_status_update", status.last_status_update}
            });
        }
        return {
            {"direction", "outgoing"},
            {"send_status", statuses}
        };
    }

    return {{"direction", "directionless"}};
}

DirectionalDetails DirectionalDetailsFromJson(const nlohmann::json& json) {
    const std::string direction = json.value("direction", "directionless");

    if (direction == "incoming") {
        IncomingMessageDetails incoming;
        incoming.date_received = json.value("date_received", uint64_t{0});
        incoming.read = json.value("read", false);
        return incoming;
    }

    if (direction == "outgoing") {
        OutgoingMessageDetails outgoing;
        if (json.contains("send_status") && json["send_status"].is_array()) {
            for (const auto& status_json : json["send_status"]) {
                SendStatus status;
                status.recipient_id = RecipientId{status_json.at("recipient_id").get<uint64_t>()};
                status.status = DeliveryStatusFromString(status_json.value("status", "pending"));
                status.last_status_update = status_json.value("last_status_update", uint64_t{0});
                outgoing.send_status.push_back(status);
            }
        }
        return outgoing;
    }

    if (direction == "directionless") {
        return DirectionlessMessageDetails{};
    }

    throw std::invalid_argument("Unknown chat item direction: " + direction);
}

} // namespace

nlohmann::json ChatItem::ToJson() const {
    nlohmann::json json_obj;

    json_obj["chat_id"] = chat_id.value;
    json_obj["author_id"] = author_id.value;
    json_obj["date_sent"] = date_sent;
    json_obj["sealed_sender"] = sealed_sender;
    json_obj["sms"] = sms;

    // 过期字段仅在设置时写出
    if (expire_start_date) {
        json_obj["expire_start_date"] = *expire_start_date;
    }
    if (expires_in_ms) {
        json_obj["expires_in_ms"] = *expires_in_ms;
    }

    json_obj["directional_details"] = DirectionalDetailsToJson(directional_details);
    json_obj["payload"] = PayloadToJson(payload);

    if (!revisions.empty()) {
        nlohmann::json revisions_json = nlohmann::json::array();
        for (const auto& revision : revisions) {
            revisions_json.push_back(revision.ToJson());
        }
        json_obj["revisions"] = revisions_json;
    }

    return json_obj;
}

ChatItem ChatItem::FromJson(const nlohmann::json& json) {
    ChatItem chat_item;

    chat_item.chat_id = ChatId{json.at("chat_id").get<uint64_t>()};
    chat_item.author_id = RecipientId{json.at("author_id").get<uint64_t>()};
    chat_item.date_sent = json.at("date_sent").get<uint64_t>();
    chat_item.sealed_sender = json.value("sealed_sender", false);
    chat_item.sms = json.value("sms", false);

    if (json.contains("expire_start_date") && json["expire_start_date"].is_number_unsigned()) {
        chat_item.expire_start_date = json["expire_start_date"].get<uint64_t>();
    }

    if (json.contains("expires_in_ms") && json["expires_in_ms"].is_number_unsigned()) {
        chat_item.expires_in_ms = json["expires_in_ms"].get<uint64_t>();
    }

    if (json.contains("directional_details")) {
        chat_item.directional_details = DirectionalDetailsFromJson(json["directional_details"]);
    } else {
        chat_item.directional_details = DirectionlessMessageDetails{};
    }

    chat_item.payload = PayloadFromJson(json.at("payload"));

    if (json.contains("revisions") && json["revisions"].is_array()) {
        for (const auto& revision_json : json["revisions"]) {
            chat_item.revisions.push_back(ChatItem::FromJson(revision_json));
        }
    }

    return chat_item;
}

bool IsMessagePayload(const ChatItemPayload& payload) {
    return !std::holds_alternative<ChatUpdateMessage>(payload);
}

} // namespace chat_backup::models
