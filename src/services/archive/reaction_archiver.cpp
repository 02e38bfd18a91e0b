#include "services/archive/reaction_archiver.h"

#include <algorithm>
#include <spdlog/spdlog.h>

namespace chat_backup::services::archive {

ReactionArchiver::ReactionArchiver(storage::ReactionStore& reaction_store)
    : reaction_store_(reaction_store) {
}

ArchiveInteractionResult<std::vector<models::BackupReaction>>
ReactionArchiver::ArchiveReactions(const models::Interaction& message,
                                   const ChatArchivingContext& context,
                                   const core::db::ReadTransaction& tx) {
    using ResultType = ArchiveInteractionResult<std::vector<models::BackupReaction>>;

    auto fetch_result = reaction_store_.FetchReactions(message.unique_id, tx);
    if (fetch_result.IsError()) {
        return ResultType::MessageFailure({
            ArchiveFrameError::ReactionLookupFailed(message.ChatItemIdentifier(), fetch_result.GetError())
        });
    }

    auto reactions = fetch_result.GetValue();

    // 排序序号按接收时间生成
    std::stable_sort(reactions.begin(), reactions.end(),
                     [](const models::Reaction& lhs, const models::Reaction& rhs) {
                         return lhs.received_at < rhs.received_at;
                     });

    std::vector<models::BackupReaction> backup_reactions;
    std::vector<ArchiveFrameError> partial_errors;
    uint64_t sort_order = 0;

    for (const auto& reaction : reactions) {
        auto author_id = context.RecipientIdFor(reaction.reactor_address);
        if (!author_id) {
            partial_errors.push_back(ArchiveFrameError::ReferencedRecipientMissing(
                message.ChatItemIdentifier().ToString(), reaction.reactor_address));
            continue;
        }

        models::BackupReaction backup_reaction;
        backup_reaction.author_id = *author_id;
        backup_reaction.emoji = reaction.emoji;
        backup_reaction.sent_timestamp = reaction.sent_at;
        backup_reaction.sort_order = sort_order++;
        backup_reactions.push_back(std::move(backup_reaction));
    }

    return ResultType::SuccessOrPartial(std::move(backup_reactions), std::move(partial_errors));
}

RestoreInteractionResult<size_t>
ReactionArchiver::RestoreReactions(const std::vector<models::BackupReaction>& reactions,
                                   const models::Interaction& message,
                                   const ChatRestoringContext& context,
                                   core::db::WriteTransaction& tx) {
    std::vector<RestoreFrameError> partial_errors;
    size_t restored_count = 0;

    for (const auto& backup_reaction : reactions) {
        auto address = context.AddressFor(backup_reaction.author_id);
        if (!address) {
            partial_errors.push_back(RestoreFrameError::IdentifierNotFound(backup_reaction.author_id));
            continue;
        }

        models::Reaction reaction;
        reaction.unique_message_id = message.unique_id;
        reaction.reactor_address = *address;
        reaction.emoji = backup_reaction.emoji;
        reaction.sent_at = backup_reaction.sent_timestamp;
        // 备份中不保存接收时间，用排序序号保持原有顺序
        reaction.received_at = message.timestamp + backup_reaction.sort_order;

        auto insert_result = reaction_store_.InsertReaction(reaction, tx);
        if (insert_result.IsError()) {
            spdlog::warn("Failed to restore reaction on {}: {}", message.unique_id, insert_result.GetError());
            partial_errors.push_back(RestoreFrameError::DatabaseInsertionFailed(insert_result.GetError()));
            continue;
        }

        ++restored_count;
    }

    return RestoreInteractionResult<size_t>::SuccessOrPartial(restored_count, std::move(partial_errors));
}

} // namespace chat_backup::services::archive
