#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/db/transaction.h"
#include "models/chat_item.h"
#include "models/interaction.h"
#include "models/thread.h"
#include "services/archive/archive_results.h"
#include "services/archive/archiving_context.h"

namespace chat_backup::services::archive {

// 归档器产出的与具体类型无关的消息描述，由调度器组装成备份记录
struct InteractionArchiveDetails {
    models::RecipientId author;
    models::DirectionalDetails directional_details;
    std::optional<uint64_t> expire_start_date;
    std::optional<uint64_t> expires_in_ms;
    bool is_sealed_sender = false;
    bool is_sms = false;
    std::vector<models::ChatItem> revisions;
    models::ChatItemPayload type;
};

// 消息归档器接口，每种消息类别一个实现
class InteractionArchiver {
public:
    virtual ~InteractionArchiver() = default;

    // 获取归档器名称
    virtual std::string GetArchiverName() const = 0;

    // 是否处理该本地消息，不得有副作用
    virtual bool CanArchiveInteraction(const models::Interaction& interaction) const = 0;

    // 是否处理该备份记录，不得有副作用
    virtual bool CanRestoreChatItem(const models::ChatItem& chat_item) const = 0;

    virtual ArchiveInteractionResult<InteractionArchiveDetails>
    ArchiveInteraction(const models::Interaction& interaction,
                       const ChatArchivingContext& context,
                       const core::db::ReadTransaction& tx) = 0;

    // 成功时返回写入的本地消息
    virtual RestoreInteractionResult<models::Interaction>
    RestoreChatItem(const models::ChatItem& chat_item,
                    const models::Thread& thread,
                    const ChatRestoringContext& context,
                    core::db::WriteTransaction& tx) = 0;
};

} // namespace chat_backup::services::archive
