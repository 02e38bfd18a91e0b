#include "services/archive/outgoing_message_archiver.h"

#include "core/utils/uuid.h"

namespace chat_backup::services::archive {

OutgoingMessageArchiver::OutgoingMessageArchiver(std::shared_ptr<MessageContentsArchiver> contents_archiver,
                                                 storage::InteractionStore& interaction_store)
    : MessageArchiverBase(std::move(contents_archiver), interaction_store) {
}

bool OutgoingMessageArchiver::CanArchiveInteraction(const models::Interaction& interaction) const {
    return interaction.kind == models::InteractionKind::kOutgoingMessage;
}

bool OutgoingMessageArchiver::CanRestoreChatItem(const models::ChatItem& chat_item) const {
    return std::holds_alternative<models::OutgoingMessageDetails>(chat_item.directional_details) &&
           models::IsMessagePayload(chat_item.payload);
}

ArchiveInteractionResult<InteractionArchiveDetails>
OutgoingMessageArchiver::ArchiveInteraction(const models::Interaction& interaction,
                                            const ChatArchivingContext& context,
                                            const core::db::ReadTransaction& tx) {
    if (interaction.edit_state == models::EditState::kPastRevision) {
        return ArchiveInteractionResult<InteractionArchiveDetails>::IsPastRevision();
    }

    std::vector<ArchiveFrameError> partial_errors;
    models::OutgoingMessageDetails outgoing;

    for (const auto& recipient_state : interaction.recipient_states) {
        auto recipient_id = context.RecipientIdFor(recipient_state.address);
        if (!recipient_id) {
            partial_errors.push_back(ArchiveFrameError::ReferencedRecipientMissing(
                interaction.ChatItemIdentifier().ToString(), recipient_state.address));
            continue;
        }

        outgoing.send_status.push_back(models::SendStatus{
            *recipient_id,
            recipient_state.status,
            recipient_state.updated_at
        });
    }

    InteractionArchiveDetails details;
    details.author = context.LocalRecipientId();
    details.directional_details = std::move(outgoing);
    details.is_sealed_sender = false;
    details.is_sms = interaction.is_sms;

    return ArchiveMessage(interaction, std::move(details), std::move(partial_errors), context, tx);
}

RestoreInteractionResult<models::Interaction>
OutgoingMessageArchiver::RestoreChatItem(const models::ChatItem& chat_item,
                                         const models::Thread& thread,
                                         const ChatRestoringContext& context,
                                         core::db::WriteTransaction& tx) {
    std::vector<RestoreFrameError> partial_errors;
    const auto& outgoing = std::get<models::OutgoingMessageDetails>(chat_item.directional_details);

    models::Interaction message;
    message.unique_id = core::utils::UuidGenerator::GenerateUuid();
    message.unique_thread_id = thread.unique_id;
    message.kind = models::InteractionKind::kOutgoingMessage;
    message.timestamp = chat_item.date_sent;
    message.received_at_timestamp = chat_item.date_sent;
    message.was_read = true;
    message.is_sms = chat_item.sms;
    ApplyExpiration(chat_item, message);

    for (const auto& send_status : outgoing.send_status) {
        auto address = context.AddressFor(send_status.recipient_id);
        if (!address) {
            partial_errors.push_back(RestoreFrameError::IdentifierNotFound(send_status.recipient_id));
            continue;
        }

        models::OutgoingRecipientState recipient_state;
        recipient_state.address = *address;
        recipient_state.status = send_status.status;
        recipient_state.updated_at = send_status.last_status_update;
        message.recipient_states.push_back(std::move(recipient_state));
    }

    return RestoreMessage(chat_item, std::move(message), std::move(partial_errors), context, tx);
}

} // namespace chat_backup::services::archive
