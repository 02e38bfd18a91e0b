#include "services/archive/message_contents_archiver.h"

#include <spdlog/spdlog.h>

#include "core/utils/uuid.h"

namespace chat_backup::services::archive {

namespace {

models::BackupAttachment ToBackupAttachment(const models::Attachment& attachment) {
    models::BackupAttachment backup_attachment;
    backup_attachment.content_type = attachment.content_type;
    backup_attachment.file_name = attachment.file_name;
    backup_attachment.size_bytes = attachment.size_bytes;
    return backup_attachment;
}

models::Attachment FromBackupAttachment(const models::BackupAttachment& backup_attachment) {
    models::Attachment attachment;
    attachment.id = core::utils::UuidGenerator::GenerateUuid();
    attachment.content_type = backup_attachment.content_type;
    attachment.file_name = backup_attachment.file_name;
    attachment.size_bytes = backup_attachment.size_bytes;
    return attachment;
}

// 返回可携带表情回应的消息体中的回应列表
std::vector<models::BackupReaction>* MutableReactionsOf(models::ChatItemPayload& payload) {
    if (auto* standard = std::get_if<models::StandardMessage>(&payload)) return &standard->reactions;
    if (auto* contact = std::get_if<models::ContactMessage>(&payload)) return &contact->reactions;
    if (auto* voice = std::get_if<models::VoiceMessage>(&payload)) return &voice->reactions;
    if (auto* sticker = std::get_if<models::StickerMessage>(&payload)) return &sticker->reactions;
    return nullptr;
}

const std::vector<models::BackupReaction>* ReactionsOf(const models::ChatItemPayload& payload) {
    if (const auto* standard = std::get_if<models::StandardMessage>(&payload)) return &standard->reactions;
    if (const auto* contact = std::get_if<models::ContactMessage>(&payload)) return &contact->reactions;
    if (const auto* voice = std::get_if<models::VoiceMessage>(&payload)) return &voice->reactions;
    if (const auto* sticker = std::get_if<models::StickerMessage>(&payload)) return &sticker->reactions;
    return nullptr;
}

} // namespace

MessageContentsArchiver::MessageContentsArchiver(std::shared_ptr<ReactionArchiver> reaction_archiver)
    : reaction_archiver_(std::move(reaction_archiver)) {
}

ArchiveInteractionResult<models::ChatItemPayload>
MessageContentsArchiver::ArchiveMessageContents(const models::Interaction& message,
                                                const ChatArchivingContext& context,
                                                const core::db::ReadTransaction& tx,
                                                bool include_reactions) {
    using ResultType = ArchiveInteractionResult<models::ChatItemPayload>;

    // 已撤回的消息只保留占位
    if (message.was_remotely_deleted) {
        return ResultType::Success(models::RemoteDeletedMessage{});
    }

    models::ChatItemPayload payload;

    if (message.sticker) {
        models::StickerMessage sticker;
        sticker.pack_id = message.sticker->pack_id;
        sticker.pack_key = message.sticker->pack_key;
        sticker.sticker_id = message.sticker->sticker_id;
        sticker.emoji = message.sticker->emoji;
        payload = std::move(sticker);
    } else if (message.contact_share) {
        models::ContactMessage contact;
        contact.name = message.contact_share->name;
        contact.phone_numbers = message.contact_share->phone_numbers;
        payload = std::move(contact);
    } else if (message.is_voice_message && message.attachments.size() == 1) {
        models::VoiceMessage voice;
        voice.audio = ToBackupAttachment(message.attachments.front());
        payload = std::move(voice);
    } else if (!message.body.empty() || !message.attachments.empty()) {
        models::StandardMessage standard;
        standard.text = message.body;
        for (const auto& attachment : message.attachments) {
            standard.attachments.push_back(ToBackupAttachment(attachment));
        }
        payload = std::move(standard);
    } else {
        return ResultType::MessageFailure({
            ArchiveFrameError::MessageContentMissing(message.ChatItemIdentifier())
        });
    }

    std::vector<ArchiveFrameError> partial_errors;

    if (include_reactions) {
        auto reactions_result = reaction_archiver_->ArchiveReactions(message, context, tx);
        const auto& reaction_errors = reactions_result.GetErrors();
        partial_errors.insert(partial_errors.end(), reaction_errors.begin(), reaction_errors.end());

        // 读取表情回应失败时仍保留消息本身
        if (reactions_result.HasValue()) {
            *MutableReactionsOf(payload) = reactions_result.GetValue();
        }
    }

    return ResultType::SuccessOrPartial(std::move(payload), std::move(partial_errors));
}

RestoreInteractionResult<models::Interaction>
MessageContentsArchiver::RestoreContents(const models::ChatItemPayload& payload, models::Interaction message) {
    using ResultType = RestoreInteractionResult<models::Interaction>;

    if (const auto* standard = std::get_if<models::StandardMessage>(&payload)) {
        if (standard->text.empty() && standard->attachments.empty()) {
            return ResultType::MessageFailure({RestoreFrameError::InvalidFrameData("empty standard message")});
        }
        message.body = standard->text;
        for (const auto& attachment : standard->attachments) {
            message.attachments.push_back(FromBackupAttachment(attachment));
        }
    } else if (const auto* contact = std::get_if<models::ContactMessage>(&payload)) {
        models::ContactShare contact_share;
        contact_share.name = contact->name;
        contact_share.phone_numbers = contact->phone_numbers;
        message.contact_share = std::move(contact_share);
    } else if (const auto* voice = std::get_if<models::VoiceMessage>(&payload)) {
        message.attachments.push_back(FromBackupAttachment(voice->audio));
        message.is_voice_message = true;
    } else if (const auto* sticker = std::get_if<models::StickerMessage>(&payload)) {
        models::StickerInfo sticker_info;
        sticker_info.pack_id = sticker->pack_id;
        sticker_info.pack_key = sticker->pack_key;
        sticker_info.sticker_id = sticker->sticker_id;
        sticker_info.emoji = sticker->emoji;
        message.sticker = std::move(sticker_info);
    } else if (std::holds_alternative<models::RemoteDeletedMessage>(payload)) {
        message.was_remotely_deleted = true;
    } else {
        return ResultType::MessageFailure({
            RestoreFrameError::InvalidFrameData("chat update payload on a message chat item")
        });
    }

    return ResultType::Success(std::move(message));
}

RestoreInteractionResult<size_t>
MessageContentsArchiver::RestoreReactions(const models::ChatItemPayload& payload,
                                          const models::Interaction& message,
                                          const ChatRestoringContext& context,
                                          core::db::WriteTransaction& tx) {
    const auto* reactions = ReactionsOf(payload);
    if (reactions == nullptr || reactions->empty()) {
        return RestoreInteractionResult<size_t>::Success(0);
    }

    spdlog::debug("Restoring {} reactions on {}", reactions->size(), message.unique_id);
    return reaction_archiver_->RestoreReactions(*reactions, message, context, tx);
}

} // namespace chat_backup::services::archive
