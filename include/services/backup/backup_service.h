#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "core/db/transaction.h"
#include "services/archive/archive_errors.h"
#include "services/archive/backup_stream.h"
#include "services/archive/chat_archiver.h"
#include "services/archive/chat_item_archiver.h"

namespace chat_backup::services::backup {

// 整份备份的导出与导入：联系人、会话、聊天记录依次处理
class BackupService {
public:
    struct ImportSummary {
        size_t frames_read = 0;
        size_t recipients_restored = 0;
        size_t chats_restored = 0;
        size_t chat_items_restored = 0;
        size_t partial_restores = 0;
        size_t failures = 0;
        // 未完全恢复的帧
        std::vector<archive::RestoreFrameResult> problems;
        // 输入流无法继续读取时的错误，导入在此处停止
        std::optional<std::string> fatal_error;

        bool IsComplete() const { return !fatal_error && failures == 0 && partial_restores == 0; }
    };

    BackupService(archive::ChatArchiver& chat_archiver,
                  archive::ChatItemArchiver& chat_item_archiver);

    archive::ArchiveMultiFrameResult Export(archive::BackupOutputStream& stream,
                                            const std::string& local_address,
                                            const core::db::ReadTransaction& tx);

    ImportSummary Import(archive::BackupInputStream& stream, core::db::WriteTransaction& tx);

private:
    void Record(const archive::RestoreFrameResult& result, size_t& restored_counter, ImportSummary& summary);

    archive::ChatArchiver& chat_archiver_;
    archive::ChatItemArchiver& chat_item_archiver_;
};

} // namespace chat_backup::services::backup
