#include "services/archive/interaction_archiver_registry.h"

#include <spdlog/spdlog.h>

#include "core/utils/string_utils.h"
#include "services/archive/incoming_message_archiver.h"
#include "services/archive/info_message_archiver.h"
#include "services/archive/outgoing_message_archiver.h"

namespace chat_backup::services::archive {

InteractionArchiverRegistry InteractionArchiverRegistry::CreateDefault(
    std::shared_ptr<MessageContentsArchiver> contents_archiver,
    storage::InteractionStore& interaction_store) {

    InteractionArchiverRegistry registry;
    registry.Register(std::make_shared<IncomingMessageArchiver>(contents_archiver, interaction_store));
    registry.Register(std::make_shared<OutgoingMessageArchiver>(contents_archiver, interaction_store));
    registry.Register(std::make_shared<InfoMessageArchiver>(interaction_store));

    spdlog::debug("Interaction archiver registry initialized: {}",
                  core::utils::StringUtils::Join(registry.GetRegisteredArchivers(), ", "));
    return registry;
}

void InteractionArchiverRegistry::Register(std::shared_ptr<InteractionArchiver> archiver) {
    if (!archiver) {
        spdlog::warn("Attempted to register a null interaction archiver");
        return;
    }

    spdlog::debug("Registered interaction archiver: {} (priority {})",
                  archiver->GetArchiverName(), archivers_.size());
    archivers_.push_back(std::move(archiver));
}

std::shared_ptr<InteractionArchiver>
InteractionArchiverRegistry::FindForInteraction(const models::Interaction& interaction) const {
    for (const auto& archiver : archivers_) {
        if (archiver->CanArchiveInteraction(interaction)) {
            return archiver;
        }
    }
    return nullptr;
}

std::shared_ptr<InteractionArchiver>
InteractionArchiverRegistry::FindForChatItem(const models::ChatItem& chat_item) const {
    for (const auto& archiver : archivers_) {
        if (archiver->CanRestoreChatItem(chat_item)) {
            return archiver;
        }
    }
    return nullptr;
}

std::vector<std::string> InteractionArchiverRegistry::GetRegisteredArchivers() const {
    std::vector<std::string> names;
    names.reserve(archivers_.size());
    for (const auto& archiver : archivers_) {
        names.push_back(archiver->GetArchiverName());
    }
    return names;
}

} // namespace chat_backup::services::archive
