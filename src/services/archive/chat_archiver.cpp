#include "services/archive/chat_archiver.h"

#include <unordered_set>
#include <vector>
#include <spdlog/spdlog.h>

#include "common/constants.h"
#include "core/utils/uuid.h"

namespace chat_backup::services::archive {

ChatArchiver::ChatArchiver(storage::ThreadStore& thread_store)
    : thread_store_(thread_store) {
}

ArchiveMultiFrameResult ChatArchiver::ArchiveChats(BackupOutputStream& stream,
                                                   const std::string& local_address,
                                                   ChatArchivingContext& context,
                                                   const core::db::ReadTransaction& tx) {
    std::vector<ArchiveFrameError> partial_errors;

    const models::RecipientId self_id{common::constants::LOCAL_RECIPIENT_ID};
    context.SetLocalRecipientId(self_id);

    auto self_result = stream.WriteFrame(models::Frame{models::RecipientFrame{self_id, local_address, true}});
    if (self_result.IsError()) {
        partial_errors.push_back(ArchiveFrameError::FrameWriteFailed(self_id.ToString(), self_result.GetError()));
    } else {
        context.MapRecipient(local_address, self_id);
    }

    auto threads_result = thread_store_.FetchAllThreads(tx);
    if (threads_result.IsError()) {
        spdlog::error("Failed to enumerate threads: {}", threads_result.GetError());
        return ArchiveMultiFrameResult::CompleteFailure(FatalArchiveError{threads_result.GetError()});
    }

    std::unordered_set<std::string> seen_addresses{local_address};
    uint64_t next_recipient_id = self_id.value + 1;
    uint64_t next_chat_id = 1;

    for (const auto& thread : threads_result.GetValue()) {
        models::ChatFrame chat_frame;
        chat_frame.id = models::ChatId{next_chat_id++};
        chat_frame.kind = thread.kind;
        chat_frame.group_id = thread.group_id;
        chat_frame.name = thread.name;

        for (const auto& address : thread.participant_addresses) {
            if (seen_addresses.insert(address).second) {
                const models::RecipientId recipient_id{next_recipient_id++};
                auto write_result = stream.WriteFrame(models::Frame{models::RecipientFrame{recipient_id, address, false}});
                if (write_result.IsError()) {
                    partial_errors.push_back(
                        ArchiveFrameError::FrameWriteFailed(recipient_id.ToString(), write_result.GetError()));
                } else {
                    context.MapRecipient(address, recipient_id);
                }
            }

            if (auto recipient_id = context.RecipientIdFor(address)) {
                chat_frame.participant_ids.push_back(*recipient_id);
            }
        }

        auto write_result = stream.WriteFrame(models::Frame{chat_frame});
        if (write_result.IsError()) {
            partial_errors.push_back(
                ArchiveFrameError::FrameWriteFailed(chat_frame.id.ToString(), write_result.GetError()));
            continue;
        }
        context.MapThread(models::ThreadUniqueId{thread.unique_id}, chat_frame.id);
    }

    spdlog::info("Archived {} chats and {} recipients", context.ChatCount(), context.RecipientCount());

    if (partial_errors.empty()) {
        return ArchiveMultiFrameResult::Success();
    }
    return ArchiveMultiFrameResult::PartialSuccess(std::move(partial_errors));
}

RestoreFrameResult ChatArchiver::RestoreRecipient(const models::RecipientFrame& frame,
                                                  ChatRestoringContext& context) {
    if (frame.address.empty()) {
        return RestoreFrameResult::Failure(frame.id.ToString(),
                                           {RestoreFrameError::InvalidFrameData("recipient without address")});
    }

    context.MapRecipient(frame.id, frame.address);
    if (frame.is_self) {
        context.SetLocalRecipientId(frame.id);
    }

    return RestoreFrameResult::Success();
}

RestoreFrameResult ChatArchiver::RestoreChat(const models::ChatFrame& frame,
                                             ChatRestoringContext& context,
                                             core::db::WriteTransaction& tx) {
    std::vector<RestoreFrameError> partial_errors;

    models::Thread thread;
    thread.unique_id = core::utils::UuidGenerator::GenerateUuid();
    thread.kind = frame.kind;
    thread.group_id = frame.group_id;
    thread.name = frame.name;

    for (const auto& participant_id : frame.participant_ids) {
        auto address = context.AddressFor(participant_id);
        if (!address) {
            partial_errors.push_back(RestoreFrameError::IdentifierNotFound(participant_id));
            continue;
        }
        thread.participant_addresses.push_back(*address);
    }

    auto insert_result = thread_store_.InsertThread(thread, tx);
    if (insert_result.IsError()) {
        spdlog::warn("Failed to insert restored thread for {}: {}", frame.id.ToString(), insert_result.GetError());
        return RestoreFrameResult::Failure(frame.id.ToString(),
                                           {RestoreFrameError::DatabaseInsertionFailed(insert_result.GetError())});
    }

    context.MapChat(frame.id, models::ThreadUniqueId{thread.unique_id});

    if (partial_errors.empty()) {
        return RestoreFrameResult::Success();
    }
    return RestoreFrameResult::PartialRestore(frame.id.ToString(), std::move(partial_errors), std::move(thread));
}

} // namespace chat_backup::services::archive
