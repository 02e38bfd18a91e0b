#pragma once

#include <memory>
#include <vector>

#include "core/db/transaction.h"
#include "models/chat_item.h"
#include "models/interaction.h"
#include "services/archive/archive_results.h"
#include "services/archive/archiving_context.h"
#include "services/archive/reaction_archiver.h"

namespace chat_backup::services::archive {

// 消息内容归档器：文本、附件、贴纸、联系人卡片、语音、已撤回消息
// 由各类消息归档器调用，调度器不直接使用
class MessageContentsArchiver {
public:
    explicit MessageContentsArchiver(std::shared_ptr<ReactionArchiver> reaction_archiver);

    // include_reactions 为 false 时不读取表情回应（历史版本不带表情回应）
    ArchiveInteractionResult<models::ChatItemPayload>
    ArchiveMessageContents(const models::Interaction& message,
                           const ChatArchivingContext& context,
                           const core::db::ReadTransaction& tx,
                           bool include_reactions = true);

    // 将消息体还原到 message 的内容字段，不访问数据库
    RestoreInteractionResult<models::Interaction>
    RestoreContents(const models::ChatItemPayload& payload, models::Interaction message);

    // 消息写入后再恢复其表情回应
    RestoreInteractionResult<size_t>
    RestoreReactions(const models::ChatItemPayload& payload,
                     const models::Interaction& message,
                     const ChatRestoringContext& context,
                     core::db::WriteTransaction& tx);

private:
    std::shared_ptr<ReactionArchiver> reaction_archiver_;
};

} // namespace chat_backup::services::archive
