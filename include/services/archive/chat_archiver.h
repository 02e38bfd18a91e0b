#pragma once

#include <cstdint>
#include <string>

#include "core/db/transaction.h"
#include "models/frame.h"
#include "services/archive/archive_errors.h"
#include "services/archive/archiving_context.h"
#include "services/archive/backup_stream.h"
#include "storage/thread_store.h"

namespace chat_backup::services::archive {

// 导出联系人和会话帧，并建立聊天记录归档所需的标识符映射
class ChatArchiver {
public:
    explicit ChatArchiver(storage::ThreadStore& thread_store);

    // 先写本机用户，再按会话顺序写出参与者和会话；写入失败的对象不会进入映射
    ArchiveMultiFrameResult ArchiveChats(BackupOutputStream& stream,
                                         const std::string& local_address,
                                         ChatArchivingContext& context,
                                         const core::db::ReadTransaction& tx);

    RestoreFrameResult RestoreRecipient(const models::RecipientFrame& frame,
                                        ChatRestoringContext& context);

    // 每个会话帧在本地新建一个会话
    RestoreFrameResult RestoreChat(const models::ChatFrame& frame,
                                   ChatRestoringContext& context,
                                   core::db::WriteTransaction& tx);

private:
    storage::ThreadStore& thread_store_;
};

} // namespace chat_backup::services::archive
