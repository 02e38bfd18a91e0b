#include "services/backup/backup_service.h"

#include <spdlog/spdlog.h>

namespace chat_backup::services::backup {

using namespace archive;

BackupService::BackupService(ChatArchiver& chat_archiver, ChatItemArchiver& chat_item_archiver)
    : chat_archiver_(chat_archiver),
      chat_item_archiver_(chat_item_archiver) {
}

ArchiveMultiFrameResult BackupService::Export(BackupOutputStream& stream,
                                              const std::string& local_address,
                                              const core::db::ReadTransaction& tx) {
    ChatArchivingContext context;
    std::vector<ArchiveFrameError> errors;

    auto chats_result = chat_archiver_.ArchiveChats(stream, local_address, context, tx);
    if (chats_result.IsCompleteFailure()) {
        return chats_result;
    }
    if (chats_result.IsPartialSuccess()) {
        errors = chats_result.GetErrors();
    }

    auto items_result = chat_item_archiver_.ArchiveInteractions(stream, context, tx);
    if (items_result.IsCompleteFailure()) {
        return items_result;
    }
    if (items_result.IsPartialSuccess()) {
        errors.insert(errors.end(), items_result.GetErrors().begin(), items_result.GetErrors().end());
    }

    if (errors.empty()) {
        spdlog::info("Backup export completed");
        return ArchiveMultiFrameResult::Success();
    }

    spdlog::warn("Backup export completed with {} errors", errors.size());
    return ArchiveMultiFrameResult::PartialSuccess(std::move(errors));
}

BackupService::ImportSummary BackupService::Import(BackupInputStream& stream, core::db::WriteTransaction& tx) {
    ImportSummary summary;
    ChatRestoringContext context;

    while (true) {
        auto frame_result = stream.ReadFrame();
        if (frame_result.IsError()) {
            spdlog::error("Backup import stopped: {}", frame_result.GetError());
            summary.fatal_error = frame_result.GetError();
            break;
        }

        const auto& frame = frame_result.GetValue();
        if (!frame) {
            break;
        }
        ++summary.frames_read;

        if (const auto* recipient = std::get_if<models::RecipientFrame>(&frame->item)) {
            Record(chat_archiver_.RestoreRecipient(*recipient, context), summary.recipients_restored, summary);
        } else if (const auto* chat = std::get_if<models::ChatFrame>(&frame->item)) {
            Record(chat_archiver_.RestoreChat(*chat, context, tx), summary.chats_restored, summary);
        } else if (const auto* chat_item = std::get_if<models::ChatItem>(&frame->item)) {
            Record(chat_item_archiver_.Restore(*chat_item, context, tx), summary.chat_items_restored, summary);
        }
    }

    spdlog::info("Backup import: {} frames read, {} recipients, {} chats, {} chat items, "
                 "{} partial, {} failed",
                 summary.frames_read, summary.recipients_restored, summary.chats_restored,
                 summary.chat_items_restored, summary.partial_restores, summary.failures);

    return summary;
}

void BackupService::Record(const RestoreFrameResult& result, size_t& restored_counter, ImportSummary& summary) {
    switch (result.GetStatus()) {
        case RestoreFrameResult::Status::kSuccess:
            ++restored_counter;
            return;
        case RestoreFrameResult::Status::kPartialRestore:
            ++restored_counter;
            ++summary.partial_restores;
            break;
        case RestoreFrameResult::Status::kFailure:
            ++summary.failures;
            break;
    }

    for (const auto& error : result.GetErrors()) {
        spdlog::warn("Restore of {}: {}", result.GetObjectId(), error.ToString());
    }
    summary.problems.push_back(result);
}

} // namespace chat_backup::services::backup
