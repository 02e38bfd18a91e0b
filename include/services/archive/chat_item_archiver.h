#pragma once

#include <cstddef>
#include <cstdint>

#include "common/types.h"
#include "core/config/config_manager.h"
#include "core/db/transaction.h"
#include "models/chat_item.h"
#include "services/archive/archive_errors.h"
#include "services/archive/archiving_context.h"
#include "services/archive/backup_stream.h"
#include "services/archive/interaction_archiver_registry.h"
#include "storage/interaction_store.h"
#include "storage/thread_store.h"

namespace chat_backup::services::archive {

struct ChatItemArchiverOptions {
    // 剩余有效期不足该值的消息不写入备份
    uint64_t min_expire_timer_ms = 0;
    // 没有归档器处理的消息记为错误，而不是静默跳过
    bool strict_unsupported = false;
    // 恢复时部分成功的记录报告为部分恢复，而不是失败
    bool preserve_partial_restore = false;

    static ChatItemArchiverOptions Defaults();
    static ChatItemArchiverOptions FromConfig(const core::config::ConfigManager& config);
};

// 最近一次归档的统计
struct ArchiveStats {
    size_t enumerated = 0;
    size_t frames_written = 0;
    size_t skipped = 0;
    // 产生了错误的消息数（含仍然写入了备份的消息）
    size_t failed = 0;
};

// 聊天记录归档调度器：遍历全部消息，交给匹配的归档器转换后写入备份流；
// 恢复时反向把备份记录交给对应归档器写回数据库
class ChatItemArchiver {
public:
    ChatItemArchiver(common::types::DateProvider date_provider,
                     storage::InteractionStore& interaction_store,
                     storage::ThreadStore& thread_store,
                     InteractionArchiverRegistry registry,
                     ChatItemArchiverOptions options);

    // 单条消息的失败不会中断归档，只有遍历失败或归档器报告致命错误时才提前结束
    ArchiveMultiFrameResult ArchiveInteractions(BackupOutputStream& stream,
                                                const ChatArchivingContext& context,
                                                const core::db::ReadTransaction& tx);

    RestoreFrameResult Restore(const models::ChatItem& chat_item,
                               const ChatRestoringContext& context,
                               core::db::WriteTransaction& tx);

    const ArchiveStats& GetLastArchiveStats() const { return last_stats_; }

private:
    ArchiveMultiFrameResult ArchiveInteraction(const models::Interaction& interaction,
                                               BackupOutputStream& stream,
                                               const ChatArchivingContext& context,
                                               const core::db::ReadTransaction& tx);

    // 消息在恢复后不久即会过期
    bool ExpiresTooSoon(const InteractionArchiveDetails& details) const;

    static models::ChatItem BuildChatItem(const models::Interaction& interaction,
                                          models::ChatId chat_id,
                                          InteractionArchiveDetails details);

    common::types::DateProvider date_provider_;
    storage::InteractionStore& interaction_store_;
    storage::ThreadStore& thread_store_;
    InteractionArchiverRegistry registry_;
    ChatItemArchiverOptions options_;
    ArchiveStats last_stats_;
};

} // namespace chat_backup::services::archive
