#pragma once

#include <memory>
#include <string>
#include <vector>

#include "services/archive/interaction_archiver.h"
#include "services/archive/message_contents_archiver.h"
#include "storage/interaction_store.h"

namespace chat_backup::services::archive {

// 按注册顺序排列优先级的归档器表，第一个匹配的归档器胜出
class InteractionArchiverRegistry {
public:
    InteractionArchiverRegistry() = default;

    // 创建包含全部内置归档器的注册表：接收消息、外发消息、会话更新
    static InteractionArchiverRegistry CreateDefault(
        std::shared_ptr<MessageContentsArchiver> contents_archiver,
        storage::InteractionStore& interaction_store);

    // 追加归档器，优先级低于已注册的归档器
    void Register(std::shared_ptr<InteractionArchiver> archiver);

    // 未找到时返回空指针
    std::shared_ptr<InteractionArchiver> FindForInteraction(const models::Interaction& interaction) const;
    std::shared_ptr<InteractionArchiver> FindForChatItem(const models::ChatItem& chat_item) const;

    std::vector<std::string> GetRegisteredArchivers() const;
    size_t Size() const { return archivers_.size(); }

private:
    std::vector<std::shared_ptr<InteractionArchiver>> archivers_;
};

} // namespace chat_backup::services::archive
