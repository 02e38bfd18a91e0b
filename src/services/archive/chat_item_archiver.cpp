#include "services/archive/chat_item_archiver.h"

#include <limits>

#include <spdlog/spdlog.h>

#include "common/constants.h"

namespace chat_backup::services::archive {

ChatItemArchiverOptions ChatItemArchiverOptions::Defaults() {
    ChatItemArchiverOptions options;
    options.min_expire_timer_ms = common::constants::MIN_EXPIRE_TIMER_MS;
    return options;
}

ChatItemArchiverOptions ChatItemArchiverOptions::FromConfig(const core::config::ConfigManager& config) {
    ChatItemArchiverOptions options = Defaults();

    int64_t min_expire_timer_ms = config.GetInt("backup.min_expire_timer_ms",
                                                static_cast<int64_t>(options.min_expire_timer_ms));
    if (min_expire_timer_ms < 0) {
        spdlog::warn("Negative backup.min_expire_timer_ms ({}), using 0", min_expire_timer_ms);
        min_expire_timer_ms = 0;
    }
    options.min_expire_timer_ms = static_cast<uint64_t>(min_expire_timer_ms);
    options.strict_unsupported = config.GetBool("archive.strict_unsupported", false);
    options.preserve_partial_restore = config.GetBool("restore.preserve_partial_restore", false);

    return options;
}

ChatItemArchiver::ChatItemArchiver(common::types::DateProvider date_provider,
                                   storage::InteractionStore& interaction_store,
                                   storage::ThreadStore& thread_store,
                                   InteractionArchiverRegistry registry,
                                   ChatItemArchiverOptions options)
    : date_provider_(std::move(date_provider)),
      interaction_store_(interaction_store),
      thread_store_(thread_store),
      registry_(std::move(registry)),
      options_(options) {
}

ArchiveMultiFrameResult ChatItemArchiver::ArchiveInteractions(BackupOutputStream& stream,
                                                              const ChatArchivingContext& context,
                                                              const core::db::ReadTransaction& tx) {
    last_stats_ = ArchiveStats{};

    auto cursor_result = interaction_store_.OpenInteractionCursor(tx);
    if (cursor_result.IsError()) {
        spdlog::error("Failed to enumerate interactions: {}", cursor_result.GetError());
        return ArchiveMultiFrameResult::CompleteFailure(FatalArchiveError{cursor_result.GetError()});
    }
    auto& cursor = cursor_result.GetValue();

    std::vector<ArchiveFrameError> partial_errors;

    while (true) {
        auto next_result = cursor->Next();
        if (next_result.IsError()) {
            spdlog::error("Interaction enumeration failed after {} items: {}",
                          last_stats_.enumerated, next_result.GetError());
            return ArchiveMultiFrameResult::CompleteFailure(FatalArchiveError{next_result.GetError()});
        }

        const auto& next = next_result.GetValue();
        if (!next) {
            break;
        }
        ++last_stats_.enumerated;

        auto item_result = ArchiveInteraction(*next, stream, context, tx);
        if (item_result.IsCompleteFailure()) {
            spdlog::error("Aborting chat item archive at {}: {}",
                          next->ChatItemIdentifier().ToString(),
                          item_result.GetFatalError().message);
            return item_result;
        }

        if (item_result.IsPartialSuccess()) {
            ++last_stats_.failed;
            for (const auto& error : item_result.GetErrors()) {
                spdlog::warn("Chat item archive error: {}", error.ToString());
                partial_errors.push_back(error);
            }
        }
    }

    spdlog::info("Chat item archive finished: {} enumerated, {} written, {} skipped, {} with errors",
                 last_stats_.enumerated, last_stats_.frames_written,
                 last_stats_.skipped, last_stats_.failed);

    if (partial_errors.empty()) {
        return ArchiveMultiFrameResult::Success();
    }
    return ArchiveMultiFrameResult::PartialSuccess(std::move(partial_errors));
}

ArchiveMultiFrameResult ChatItemArchiver::ArchiveInteraction(const models::Interaction& interaction,
                                                             BackupOutputStream& stream,
                                                             const ChatArchivingContext& context,
                                                             const core::db::ReadTransaction& tx) {
    const auto item_id = interaction.ChatItemIdentifier();
    const models::ThreadUniqueId thread_id{interaction.unique_thread_id};

    auto chat_id = context[thread_id];
    if (!chat_id) {
        return ArchiveMultiFrameResult::PartialSuccess({
            ArchiveFrameError::ReferencedIdMissing(item_id, thread_id)
        });
    }

    auto archiver = registry_.FindForInteraction(interaction);
    if (!archiver) {
        if (options_.strict_unsupported) {
            return ArchiveMultiFrameResult::PartialSuccess({
                ArchiveFrameError::UnsupportedInteraction(item_id, models::ToString(interaction.kind))
            });
        }
        spdlog::debug("No archiver for {} ({}), skipping",
                      item_id.ToString(), models::ToString(interaction.kind));
        ++last_stats_.skipped;
        return ArchiveMultiFrameResult::Success();
    }

    auto archive_result = archiver->ArchiveInteraction(interaction, context, tx);

    std::vector<ArchiveFrameError> partial_errors;
    using Status = ArchiveInteractionResult<InteractionArchiveDetails>::Status;
    switch (archive_result.GetStatus()) {
        case Status::kSuccess:
            break;
        case Status::kIsPastRevision:
        case Status::kNotYetImplemented:
            spdlog::debug("Archiver {} skipped {}", archiver->GetArchiverName(), item_id.ToString());
            ++last_stats_.skipped;
            return ArchiveMultiFrameResult::Success();
        case Status::kMessageFailure:
            return ArchiveMultiFrameResult::PartialSuccess(archive_result.GetErrors());
        case Status::kPartialFailure:
            partial_errors = archive_result.GetErrors();
            break;
        case Status::kCompleteFailure:
            return ArchiveMultiFrameResult::CompleteFailure(archive_result.GetFatalError());
    }

    auto& details = archive_result.GetValue();

    if (ExpiresTooSoon(details)) {
        spdlog::debug("Skipping {}: expires within {} ms", item_id.ToString(), options_.min_expire_timer_ms);
        ++last_stats_.skipped;
        if (partial_errors.empty()) {
            return ArchiveMultiFrameResult::Success();
        }
        return ArchiveMultiFrameResult::PartialSuccess(std::move(partial_errors));
    }

    models::Frame frame{BuildChatItem(interaction, *chat_id, std::move(details))};

    auto write_result = stream.WriteFrame(frame);
    if (write_result.IsError()) {
        partial_errors.push_back(ArchiveFrameError::FrameWriteFailed(item_id.ToString(), write_result.GetError()));
    } else {
        ++last_stats_.frames_written;
    }

    if (partial_errors.empty()) {
        return ArchiveMultiFrameResult::Success();
    }
    return ArchiveMultiFrameResult::PartialSuccess(std::move(partial_errors));
}

bool ChatItemArchiver::ExpiresTooSoon(const InteractionArchiveDetails& details) const {
    if (!details.expire_start_date || !details.expires_in_ms) {
        return false;
    }

    // now + min_expire_timer_ms 溢出时取上限
    const uint64_t now = common::types::ToMillisecondsSince1970(date_provider_());
    const uint64_t min_expire_time =
        options_.min_expire_timer_ms > std::numeric_limits<uint64_t>::max() - now
            ? std::numeric_limits<uint64_t>::max()
            : now + options_.min_expire_timer_ms;

    // 等价于 start + expires_in_ms < min_expire_time，不做加法
    const uint64_t start = *details.expire_start_date;
    if (start >= min_expire_time) {
        return false;
    }
    return *details.expires_in_ms < min_expire_time - start;
}

models::ChatItem ChatItemArchiver::BuildChatItem(const models::Interaction& interaction,
                                                 models::ChatId chat_id,
                                                 InteractionArchiveDetails details) {
    models::ChatItem chat_item;
    chat_item.chat_id = chat_id;
    chat_item.author_id = details.author;
    chat_item.date_sent = interaction.timestamp;
    chat_item.sealed_sender = details.is_sealed_sender;
    chat_item.sms = details.is_sms;
    chat_item.expire_start_date = details.expire_start_date;
    chat_item.expires_in_ms = details.expires_in_ms;
    chat_item.directional_details = std::move(details.directional_details);
    chat_item.payload = std::move(details.type);
    chat_item.revisions = std::move(details.revisions);

    for (auto& revision : chat_item.revisions) {
        revision.chat_id = chat_id;
    }

    return chat_item;
}

RestoreFrameResult ChatItemArchiver::Restore(const models::ChatItem& chat_item,
                                             const ChatRestoringContext& context,
                                             core::db::WriteTransaction& tx) {
    const std::string object_id = chat_item.Id().ToString();

    auto archiver = registry_.FindForChatItem(chat_item);
    if (!archiver) {
        if (options_.strict_unsupported) {
            return RestoreFrameResult::Failure(object_id, {RestoreFrameError::UnsupportedChatItem()});
        }
        spdlog::debug("No archiver restores {}, skipping", object_id);
        return RestoreFrameResult::Success();
    }

    auto thread_id = context[chat_item.chat_id];
    if (!thread_id) {
        return RestoreFrameResult::Failure(object_id, {RestoreFrameError::IdentifierNotFound(chat_item.chat_id)});
    }

    auto thread = thread_store_.FetchThread(thread_id->value, tx);
    if (!thread) {
        return RestoreFrameResult::Failure(object_id,
                                           {RestoreFrameError::ReferencedDatabaseObjectNotFound(*thread_id)});
    }

    auto restore_result = archiver->RestoreChatItem(chat_item, *thread, context, tx);

    using Status = RestoreInteractionResult<models::Interaction>::Status;
    switch (restore_result.GetStatus()) {
        case Status::kSuccess:
            return RestoreFrameResult::Success();
        case Status::kPartialRestore:
            if (options_.preserve_partial_restore) {
                return RestoreFrameResult::PartialRestore(object_id, restore_result.GetErrors(),
                                                          restore_result.GetValue());
            }
            return RestoreFrameResult::Failure(object_id, restore_result.GetErrors());
        case Status::kMessageFailure:
            return RestoreFrameResult::Failure(object_id, restore_result.GetErrors());
    }

    return RestoreFrameResult::Failure(object_id, restore_result.GetErrors());
}

} // namespace chat_backup::services::archive
