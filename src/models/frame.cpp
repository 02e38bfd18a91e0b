#include "models/frame.h"

#include <stdexcept>

namespace chat_backup::models {

nlohmann::json Frame::ToJson() const {
    nlohmann::json json_obj;

    if (const auto* recipient = std::get_if<RecipientFrame>(&item)) {
        json_obj["frame"] = "recipient";
        json_obj["id"] = recipient->id.value;
        json_obj["address"] = recipient->address;
        json_obj["is_self"] = recipient->is_self;
    } else if (const auto* chat = std::get_if<ChatFrame>(&item)) {
        json_obj["frame"] = "chat";
        json_obj["id"] = chat->id.value;
        json_obj["kind"] = ToString(chat->kind);

        nlohmann::json participants = nlohmann::json::array();
        for (const auto& participant : chat->participant_ids) {
            participants.push_back(participant.value);
        }
        json_obj["participant_ids"] = participants;

        if (!chat->group_id.empty()) {
            json_obj["group_id"] = chat->group_id;
        }
        if (!chat->name.empty()) {
            json_obj["name"] = chat->name;
        }
    } else {
        json_obj = std::get<ChatItem>(item).ToJson();
        json_obj["frame"] = "chat_item";
    }

    return json_obj;
}

Frame Frame::FromJson(const nlohmann::json& json) {
    const std::string frame_type = json.at("frame").get<std::string>();

    if (frame_type == "recipient") {
        RecipientFrame recipient;
        recipient.id = RecipientId{json.at("id").get<uint64_t>()};
        recipient.address = json.at("address").get<std::string>();
        recipient.is_self = json.value("is_self", false);
        return Frame{recipient};
    }

    if (frame_type == "chat") {
        ChatFrame chat;
        chat.id = ChatId{json.at("id").get<uint64_t>()};
        chat.kind = ThreadKindFromString(json.value("kind", "contact"));
        if (json.contains("participant_ids") && json["participant_ids"].is_array()) {
            for (const auto& participant : json["participant_ids"]) {
                chat.participant_ids.push_back(RecipientId{participant.get<uint64_t>()});
            }
        }
        chat.group_id = json.value("group_id", "");
        chat.name = json.value("name", "");
        return Frame{chat};
    }

    if (frame_type == "chat_item") {
        return Frame{ChatItem::FromJson(json)};
    }

    throw std::invalid_argument("Unknown frame type: " + frame_type);
}

} // namespace chat_backup::models
