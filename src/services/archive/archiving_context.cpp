#include "services/archive/archiving_context.h"

namespace chat_backup::services::archive {

void ChatArchivingContext::MapThread(const models::ThreadUniqueId& thread_id, models::ChatId chat_id) {
    chat_ids_[thread_id] = chat_id;
}

void ChatArchivingContext::MapRecipient(const std::string& address, models::RecipientId recipient_id) {
    recipient_ids_[address] = recipient_id;
}

void ChatArchivingContext::SetLocalRecipientId(models::RecipientId recipient_id) {
    local_recipient_id_ = recipient_id;
}

std::optional<models::ChatId> ChatArchivingContext::operator[](const models::ThreadUniqueId& thread_id) const {
    auto it = chat_ids_.find(thread_id);
    if (it == chat_ids_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<models::RecipientId> ChatArchivingContext::RecipientIdFor(const std::string& address) const {
    auto it = recipient_ids_.find(address);
    if (it == recipient_ids_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void ChatRestoringContext::MapChat(models::ChatId chat_id, const models::ThreadUniqueId& thread_id) {
    thread_ids_[chat_id] = thread_id;
}

void ChatRestoringContext::MapRecipient(models::RecipientId recipient_id, const std::string& address) {
    addresses_[recipient_id] = address;
}

void ChatRestoringContext::SetLocalRecipientId(models::RecipientId recipient_id) {
    local_recipient_id_ = recipient_id;
}

std::optional<models::ThreadUniqueId> ChatRestoringContext::operator[](const models::ChatId& chat_id) const {
    auto it = thread_ids_.find(chat_id);
    if (it == thread_ids_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> ChatRestoringContext::AddressFor(const models::RecipientId& recipient_id) const {
    auto it = addresses_.find(recipient_id);
    if (it == addresses_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace chat_backup::services::archive
