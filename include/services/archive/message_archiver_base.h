#pragma once

#include <memory>
#include <vector>

#include "services/archive/interaction_archiver.h"
#include "services/archive/message_contents_archiver.h"
#include "storage/interaction_store.h"

namespace chat_backup::services::archive {

// 接收消息与外发消息归档器的公共部分：消息内容、编辑历史、过期字段
class MessageArchiverBase : public InteractionArchiver {
protected:
    MessageArchiverBase(std::shared_ptr<MessageContentsArchiver> contents_archiver,
                        storage::InteractionStore& interaction_store);

    // details 中作者与方向信息由子类填好，这里补充内容、过期字段和历史版本
    ArchiveInteractionResult<InteractionArchiveDetails>
    ArchiveMessage(const models::Interaction& interaction,
                   InteractionArchiveDetails details,
                   std::vector<ArchiveFrameError> partial_errors,
                   const ChatArchivingContext& context,
                   const core::db::ReadTransaction& tx);

    // message 中作者与方向信息由子类填好，这里还原内容并写入消息、表情回应和历史版本
    RestoreInteractionResult<models::Interaction>
    RestoreMessage(const models::ChatItem& chat_item,
                   models::Interaction message,
                   std::vector<RestoreFrameError> partial_errors,
                   const ChatRestoringContext& context,
                   core::db::WriteTransaction& tx);

    static void ApplyExpiration(const models::ChatItem& chat_item, models::Interaction& message);

    std::shared_ptr<MessageContentsArchiver> contents_archiver_;
    storage::InteractionStore& interaction_store_;

private:
    void ArchiveRevisions(const models::Interaction& interaction,
                          InteractionArchiveDetails& details,
                          std::vector<ArchiveFrameError>& partial_errors,
                          const ChatArchivingContext& context,
                          const core::db::ReadTransaction& tx);

    void RestoreRevisions(const models::ChatItem& chat_item,
                          const models::Interaction& revision_template,
                          const models::Interaction& latest_revision,
                          std::vector<RestoreFrameError>& partial_errors,
                          core::db::WriteTransaction& tx);
};

} // namespace chat_backup::services::archive
