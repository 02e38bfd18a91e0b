#pragma once

#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

#include "models/chat_item.h"
#include "models/identifiers.h"
#include "models/thread.h"

namespace chat_backup::models {

struct RecipientFrame {
    RecipientId id;
    std::string address;
    bool is_self = false;
};

struct ChatFrame {
    ChatId id;
    ThreadKind kind = ThreadKind::kContact;
    std::vector<RecipientId> participant_ids;
    std::string group_id;
    std::string name;
};

// 备份输出流中的一帧
struct Frame {
    std::variant<RecipientFrame, ChatFrame, ChatItem> item;

    nlohmann::json ToJson() const;
    static Frame FromJson(const nlohmann::json& json);
};

} // namespace chat_backup::models
