#pragma once

#include <optional>
#include <string>
#include <unordered_map>

#include "models/identifiers.h"

namespace chat_backup::services::archive {

// 导出会话的标识符映射：本地会话 -> 备份会话，联系人地址 -> 备份联系人
// 在归档聊天记录之前建立，归档期间只读
class ChatArchivingContext {
public:
    ChatArchivingContext() = default;

    void MapThread(const models::ThreadUniqueId& thread_id, models::ChatId chat_id);
    void MapRecipient(const std::string& address, models::RecipientId recipient_id);
    void SetLocalRecipientId(models::RecipientId recipient_id);

    std::optional<models::ChatId> operator[](const models::ThreadUniqueId& thread_id) const;
    std::optional<models::RecipientId> RecipientIdFor(const std::string& address) const;

    // 本机用户，作为外发消息的作者
    models::RecipientId LocalRecipientId() const { return local_recipient_id_; }

    size_t ChatCount() const { return chat_ids_.size(); }
    size_t RecipientCount() const { return recipient_ids_.size(); }

private:
    std::unordered_map<models::ThreadUniqueId, models::ChatId> chat_ids_;
    std::unordered_map<std::string, models::RecipientId> recipient_ids_;
    models::RecipientId local_recipient_id_;
};

// 导入会话的标识符映射：备份会话 -> 本地会话，备份联系人 -> 联系人地址
class ChatRestoringContext {
public:
    ChatRestoringContext() = default;

    void MapChat(models::ChatId chat_id, const models::ThreadUniqueId& thread_id);
    void MapRecipient(models::RecipientId recipient_id, const std::string& address);
    void SetLocalRecipientId(models::RecipientId recipient_id);

    std::optional<models::ThreadUniqueId> operator[](const models::ChatId& chat_id) const;
    std::optional<std::string> AddressFor(const models::RecipientId& recipient_id) const;

    std::optional<models::RecipientId> LocalRecipientId() const { return local_recipient_id_; }

private:
    std::unordered_map<models::ChatId, models::ThreadUniqueId> thread_ids_;
    std::unordered_map<models::RecipientId, std::string> addresses_;
    std::optional<models::RecipientId> local_recipient_id_;
};

} // namespace chat_backup::services::archive
