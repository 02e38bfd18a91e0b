#include "services/archive/message_archiver_base.h"

#include <spdlog/spdlog.h>

#include "core/utils/uuid.h"

namespace chat_backup::services::archive {

MessageArchiverBase::MessageArchiverBase(std::shared_ptr<MessageContentsArchiver> contents_archiver,
                                         storage::InteractionStore& interaction_store)
    : contents_archiver_(std::move(contents_archiver)),
      interaction_store_(interaction_store) {
}

ArchiveInteractionResult<InteractionArchiveDetails>
MessageArchiverBase::ArchiveMessage(const models::Interaction& interaction,
                                    InteractionArchiveDetails details,
                                    std::vector<ArchiveFrameError> partial_errors,
                                    const ChatArchivingContext& context,
                                    const core::db::ReadTransaction& tx) {
    using ResultType = ArchiveInteractionResult<InteractionArchiveDetails>;

    auto contents_result = contents_archiver_->ArchiveMessageContents(interaction, context, tx);
    if (!contents_result.HasValue()) {
        return contents_result.Forward<InteractionArchiveDetails>();
    }

    const auto& contents_errors = contents_result.GetErrors();
    partial_errors.insert(partial_errors.end(), contents_errors.begin(), contents_errors.end());
    details.type = std::move(contents_result.GetValue());

    if (interaction.expire_started_at > 0) {
        details.expire_start_date = interaction.expire_started_at;
    }
    if (interaction.expires_in_seconds > 0) {
        details.expires_in_ms = static_cast<uint64_t>(interaction.expires_in_seconds) * 1000;
    }

    if (interaction.edit_state == models::EditState::kLatestRevision) {
        ArchiveRevisions(interaction, details, partial_errors, context, tx);
    }

    return ResultType::SuccessOrPartial(std::move(details), std::move(partial_errors));
}

void MessageArchiverBase::ArchiveRevisions(const models::Interaction& interaction,
                                           InteractionArchiveDetails& details,
                                           std::vector<ArchiveFrameError>& partial_errors,
                                           const ChatArchivingContext& context,
                                           const core::db::ReadTransaction& tx) {
    auto revisions_result = interaction_store_.FetchPastRevisions(interaction, tx);
    if (revisions_result.IsError()) {
        partial_errors.push_back(ArchiveFrameError::RevisionLookupFailed(
            interaction.ChatItemIdentifier(), revisions_result.GetError()));
        return;
    }

    for (const auto& past_revision : revisions_result.GetValue()) {
        auto revision_contents = contents_archiver_->ArchiveMessageContents(
            past_revision, context, tx, /*include_reactions=*/false);

        const auto& revision_errors = revision_contents.GetErrors();
        partial_errors.insert(partial_errors.end(), revision_errors.begin(), revision_errors.end());
        if (!revision_contents.HasValue()) {
            continue;
        }

        // 会话标识由调度器在组装记录时填入
        models::ChatItem revision;
        revision.author_id = details.author;
        revision.date_sent = past_revision.timestamp;
        revision.sealed_sender = details.is_sealed_sender;
        revision.sms = details.is_sms;
        revision.directional_details = details.directional_details;
        revision.payload = revision_contents.GetValue();
        details.revisions.push_back(std::move(revision));
    }
}

RestoreInteractionResult<models::Interaction>
MessageArchiverBase::RestoreMessage(const models::ChatItem& chat_item,
                                    models::Interaction message,
                                    std::vector<RestoreFrameError> partial_errors,
                                    const ChatRestoringContext& context,
                                    core::db::WriteTransaction& tx) {
    using ResultType = RestoreInteractionResult<models::Interaction>;

    const models::Interaction revision_template = message;

    auto contents_result = contents_archiver_->RestoreContents(chat_item.payload, std::move(message));
    if (contents_result.GetStatus() == ResultType::Status::kMessageFailure) {
        const auto& contents_errors = contents_result.GetErrors();
        partial_errors.insert(partial_errors.end(), contents_errors.begin(), contents_errors.end());
        return ResultType::MessageFailure(std::move(partial_errors));
    }

    models::Interaction restored = contents_result.GetValue();
    if (!chat_item.revisions.empty()) {
        restored.edit_state = models::EditState::kLatestRevision;
    }

    auto insert_result = interaction_store_.InsertInteraction(restored, tx);
    if (insert_result.IsError()) {
        spdlog::warn("Failed to insert restored message {}: {}",
                     chat_item.Id().ToString(), insert_result.GetError());
        partial_errors.push_back(RestoreFrameError::DatabaseInsertionFailed(insert_result.GetError()));
        return ResultType::MessageFailure(std::move(partial_errors));
    }

    auto reactions_result = contents_archiver_->RestoreReactions(chat_item.payload, restored, context, tx);
    const auto& reaction_errors = reactions_result.GetErrors();
    partial_errors.insert(partial_errors.end(), reaction_errors.begin(), reaction_errors.end());

    RestoreRevisions(chat_item, revision_template, restored, partial_errors, tx);

    return ResultType::SuccessOrPartial(std::move(restored), std::move(partial_errors));
}

void MessageArchiverBase::RestoreRevisions(const models::ChatItem& chat_item,
                                           const models::Interaction& revision_template,
                                           const models::Interaction& latest_revision,
                                           std::vector<RestoreFrameError>& partial_errors,
                                           core::db::WriteTransaction& tx) {
    for (const auto& revision : chat_item.revisions) {
        models::Interaction past_revision = revision_template;
        past_revision.unique_id = core::utils::UuidGenerator::GenerateUuid();
        past_revision.timestamp = revision.date_sent;
        past_revision.edit_state = models::EditState::kPastRevision;
        past_revision.latest_revision_id = latest_revision.unique_id;

        auto contents_result = contents_archiver_->RestoreContents(revision.payload, std::move(past_revision));
        if (contents_result.GetStatus() ==
            RestoreInteractionResult<models::Interaction>::Status::kMessageFailure) {
            const auto& contents_errors = contents_result.GetErrors();
            partial_errors.insert(partial_errors.end(), contents_errors.begin(), contents_errors.end());
            continue;
        }

        auto insert_result = interaction_store_.InsertInteraction(contents_result.GetValue(), tx);
        if (insert_result.IsError()) {
            partial_errors.push_back(RestoreFrameError::DatabaseInsertionFailed(insert_result.GetError()));
        }
    }
}

void MessageArchiverBase::ApplyExpiration(const models::ChatItem& chat_item, models::Interaction& message) {
    message.expire_started_at = chat_item.expire_start_date.value_or(0);
    message.expires_in_seconds = static_cast<uint32_t>(chat_item.expires_in_ms.value_or(0) / 1000);
}

} // namespace chat_backup::services::archive
