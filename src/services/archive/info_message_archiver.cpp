#include "services/archive/info_message_archiver.h"

#include <spdlog/spdlog.h>

#include "core/utils/uuid.h"

namespace chat_backup::services::archive {

InfoMessageArchiver::InfoMessageArchiver(storage::InteractionStore& interaction_store)
    : interaction_store_(interaction_store) {
}

bool InfoMessageArchiver::CanArchiveInteraction(const models::Interaction& interaction) const {
    return interaction.kind == models::InteractionKind::kInfoMessage;
}

bool InfoMessageArchiver::CanRestoreChatItem(const models::ChatItem& chat_item) const {
    return std::holds_alternative<models::ChatUpdateMessage>(chat_item.payload);
}

ArchiveInteractionResult<InteractionArchiveDetails>
InfoMessageArchiver::ArchiveInteraction(const models::Interaction& interaction,
                                        const ChatArchivingContext& context,
                                        const core::db::ReadTransaction& /*tx*/) {
    using ResultType = ArchiveInteractionResult<InteractionArchiveDetails>;

    if (interaction.info_type == models::InfoMessageType::kUnknown) {
        return ResultType::NotYetImplemented();
    }

    InteractionArchiveDetails details;
    details.author = context.LocalRecipientId();
    details.directional_details = models::DirectionlessMessageDetails{};
    details.type = models::ChatUpdateMessage{interaction.info_type, interaction.info_detail};

    if (interaction.expire_started_at > 0) {
        details.expire_start_date = interaction.expire_started_at;
    }
    if (interaction.expires_in_seconds > 0) {
        details.expires_in_ms = static_cast<uint64_t>(interaction.expires_in_seconds) * 1000;
    }

    return ResultType::Success(std::move(details));
}

RestoreInteractionResult<models::Interaction>
InfoMessageArchiver::RestoreChatItem(const models::ChatItem& chat_item,
                                     const models::Thread& thread,
                                     const ChatRestoringContext& /*context*/,
                                     core::db::WriteTransaction& tx) {
    using ResultType = RestoreInteractionResult<models::Interaction>;

    const auto& update = std::get<models::ChatUpdateMessage>(chat_item.payload);
    if (update.update_type == models::InfoMessageType::kUnknown) {
        return ResultType::MessageFailure({RestoreFrameError::InvalidFrameData("unknown chat update type")});
    }

    models::Interaction message;
    message.unique_id = core::utils::UuidGenerator::GenerateUuid();
    message.unique_thread_id = thread.unique_id;
    message.kind = models::InteractionKind::kInfoMessage;
    message.timestamp = chat_item.date_sent;
    message.received_at_timestamp = chat_item.date_sent;
    message.info_type = update.update_type;
    message.info_detail = update.detail;
    message.expire_started_at = chat_item.expire_start_date.value_or(0);
    message.expires_in_seconds = static_cast<uint32_t>(chat_item.expires_in_ms.value_or(0) / 1000);

    auto insert_result = interaction_store_.InsertInteraction(message, tx);
    if (insert_result.IsError()) {
        spdlog::warn("Failed to insert restored chat update {}: {}",
                     chat_item.Id().ToString(), insert_result.GetError());
        return ResultType::MessageFailure({RestoreFrameError::DatabaseInsertionFailed(insert_result.GetError())});
    }

    return ResultType::Success(std::move(message));
}

} // namespace chat_backup::services::archive
