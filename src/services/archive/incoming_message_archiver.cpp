#include "services/archive/incoming_message_archiver.h"

#include "core/utils/uuid.h"

namespace chat_backup::services::archive {

IncomingMessageArchiver::IncomingMessageArchiver(std::shared_ptr<MessageContentsArchiver> contents_archiver,
                                                 storage::InteractionStore& interaction_store)
    : MessageArchiverBase(std::move(contents_archiver), interaction_store) {
}

bool IncomingMessageArchiver::CanArchiveInteraction(const models::Interaction& interaction) const {
    return interaction.kind == models::InteractionKind::kIncomingMessage;
}

bool IncomingMessageArchiver::CanRestoreChatItem(const models::ChatItem& chat_item) const {
    return std::holds_alternative<models::IncomingMessageDetails>(chat_item.directional_details) &&
           models::IsMessagePayload(chat_item.payload);
}

ArchiveInteractionResult<InteractionArchiveDetails>
IncomingMessageArchiver::ArchiveInteraction(const models::Interaction& interaction,
                                            const ChatArchivingContext& context,
                                            const core::db::ReadTransaction& tx) {
    using ResultType = ArchiveInteractionResult<InteractionArchiveDetails>;

    if (interaction.edit_state == models::EditState::kPastRevision) {
        return ResultType::IsPastRevision();
    }

    auto author_id = context.RecipientIdFor(interaction.author_address);
    if (!author_id) {
        return ResultType::MessageFailure({
            ArchiveFrameError::ReferencedRecipientMissing(interaction.ChatItemIdentifier().ToString(),
                                                          interaction.author_address)
        });
    }

    InteractionArchiveDetails details;
    details.author = *author_id;
    details.directional_details = models::IncomingMessageDetails{
        interaction.received_at_timestamp,
        interaction.was_read
    };
    details.is_sealed_sender = interaction.was_received_by_ud;
    details.is_sms = interaction.is_sms;

    return ArchiveMessage(interaction, std::move(details), {}, context, tx);
}

RestoreInteractionResult<models::Interaction>
IncomingMessageArchiver::RestoreChatItem(const models::ChatItem& chat_item,
                                         const models::Thread& thread,
                                         const ChatRestoringContext& context,
                                         core::db::WriteTransaction& tx) {
    auto author_address = context.AddressFor(chat_item.author_id);
    if (!author_address) {
        return RestoreInteractionResult<models::Interaction>::MessageFailure({
            RestoreFrameError::IdentifierNotFound(chat_item.author_id)
        });
    }

    const auto& incoming = std::get<models::IncomingMessageDetails>(chat_item.directional_details);

    models::Interaction message;
    message.unique_id = core::utils::UuidGenerator::GenerateUuid();
    message.unique_thread_id = thread.unique_id;
    message.kind = models::InteractionKind::kIncomingMessage;
    message.timestamp = chat_item.date_sent;
    message.received_at_timestamp = incoming.date_received;
    message.author_address = *author_address;
    message.was_read = incoming.read;
    message.was_received_by_ud = chat_item.sealed_sender;
    message.is_sms = chat_item.sms;
    ApplyExpiration(chat_item, message);

    return RestoreMessage(chat_item, std::move(message), {}, context, tx);
}

} // namespace chat_backup::services::archive
