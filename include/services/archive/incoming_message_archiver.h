#pragma once

#include <memory>
#include <string>

#include "services/archive/message_archiver_base.h"

namespace chat_backup::services::archive {

class IncomingMessageArchiver : public MessageArchiverBase {
public:
    IncomingMessageArchiver(std::shared_ptr<MessageContentsArchiver> contents_archiver,
                            storage::InteractionStore& interaction_store);

    std::string GetArchiverName() const override { return "incoming_message"; }

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
};

} // namespace chat_backup::services::archive
