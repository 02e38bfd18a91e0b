#pragma once

#include <string>

#include "services/archive/interaction_archiver.h"
#include "storage/interaction_store.h"

namespace chat_backup::services::archive {

// 会话内的系统提示（群组变更、消息定时器变更等），备份为会话更新记录
class InfoMessageArchiver : public InteractionArchiver {
public:
    explicit InfoMessageArchiver(storage::InteractionStore& interaction_store);

    std::string GetArchiverName() const override { return "info_message"; }

    bool CanArchiveInteraction(const models::Interaction& interaction) const override;
    bool CanRestoreChatItem(const models::ChatItem& chat_item) const override;

    ArchiveInteractionResult<InteractionArchiveDetails>
    ArchiveInteraction(const models::Interaction& interaction,
                       const ChatArchivingContext& context,
                       const core::db::ReadTransaction& tx) override;

    RestoreInteractionResult<models::Interaction>
    RestoreChatItem(const models::ChatItem& chat_item,
                    const models::Thread& thread,
                    const ChatRestoringContext& context,
                    core::db::WriteTransaction& tx) override;

private:
    storage::InteractionStore& interaction_store_;
};

} // namespace chat_backup::services::archive
