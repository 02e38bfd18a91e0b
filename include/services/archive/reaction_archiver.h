#pragma once

#include <vector>

#include "core/db/transaction.h"
#include "models/chat_item.h"
#include "models/interaction.h"
#include "services/archive/archive_results.h"
#include "services/archive/archiving_context.h"
#include "storage/reaction_store.h"

namespace chat_backup::services::archive {

class ReactionArchiver {
public:
    explicit ReactionArchiver(storage::ReactionStore& reaction_store);

    // 作者无法解析的表情回应被跳过并记为部分错误
    ArchiveInteractionResult<std::vector<models::BackupReaction>>
    ArchiveReactions(const models::Interaction& message,
                     const ChatArchivingContext& context,
                     const core::db::ReadTransaction& tx);

    // 返回成功写入的表情回应数量
    RestoreInteractionResult<size_t>
    RestoreReactions(const std::vector<models::BackupReaction>& reactions,
                     const models::Interaction& message,
                     const ChatRestoringContext& context,
                     core::db::WriteTransaction& tx);

private:
    storage::ReactionStore& reaction_store_;
};

} // namespace chat_backup::services::archive
