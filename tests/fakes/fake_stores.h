#pragma once

#include <deque>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "core/db/transaction.h"
#include "models/frame.h"
#include "services/archive/backup_stream.h"
#include "services/archive/interaction_archiver.h"
#include "storage/interaction_store.h"
#include "storage/reaction_store.h"
#include "storage/thread_store.h"

namespace chat_backup::tests {

class FakeTransaction : public core::db::WriteTransaction {
};

// 内存中的消息表；可在第 N 条之后模拟遍历失败
class InMemoryInteractionStore : public storage::InteractionStore {
public:
    common::Result<std::unique_ptr<storage::InteractionCursor>>
    OpenInteractionCursor(const core::db::ReadTransaction& tx) override;

    common::Result<std::vector<models::Interaction>>
    FetchPastRevisions(const models::Interaction& latest_revision,
                       const core::db::ReadTransaction& tx) override;

    common::Result<void> InsertInteraction(const models::Interaction& interaction,
                                           core::db::WriteTransaction& tx) override;

    std::vector<models::Interaction> interactions;
    std::map<std::string, std::vector<models::Interaction>> past_revisions;
    std::vector<models::Interaction> inserted;

    std::optional<std::string> open_error;
    std::optional<size_t> fail_after;
    std::optional<std::string> revision_error;
    std::optional<std::string> insert_error;

    size_t items_yielded = 0;
};

class InMemoryThreadStore : public storage::ThreadStore {
public:
    std::optional<models::Thread> FetchThread(const std::string& unique_id,
                                              const core::db::ReadTransaction& tx) override;

    common::Result<std::vector<models::Thread>>
    FetchAllThreads(const core::db::ReadTransaction& tx) override;

    common::Result<void> InsertThread(const models::Thread& thread,
                                      core::db::WriteTransaction& tx) override;

    std::vector<models::Thread> threads;
    std::optional<std::string> enumerate_error;
    std::optional<std::string> insert_error;
    size_t fetch_count = 0;
};

class InMemoryReactionStore : public storage::ReactionStore {
public:
    common::Result<std::vector<models::Reaction>>
    FetchReactions(const std::string& unique_message_id,
                   const core::db::ReadTransaction& tx) override;

    common::Result<void> InsertReaction(const models::Reaction& reaction,
                                        core::db::WriteTransaction& tx) override;

    std::vector<models::Reaction> reactions;
    std::vector<models::Reaction> inserted;
    std::optional<std::string> fetch_error;
    std::optional<std::string> insert_error;
};

// 记录写入的帧；fail_when 返回 true 的帧写入失败
class RecordingOutputStream : public services::archive::BackupOutputStream {
public:
    common::Result<void> WriteFrame(const models::Frame& frame) override;

    std::vector<models::ChatItem> ChatItems() const;

    std::vector<models::Frame> frames;
    std::function<bool(const models::Frame&)> fail_when;
    size_t write_attempts = 0;
};

class QueuedInputStream : public services::archive::BackupInputStream {
public:
    common::Result<std::optional<models::Frame>> ReadFrame() override;

    std::deque<models::Frame> frames;
    // 所有帧读完后返回该错误
    std::optional<std::string> trailing_error;
};

// 可配置匹配条件与返回结果的归档器
class StubInteractionArchiver : public services::archive::InteractionArchiver {
public:
    using ArchiveResult = services::archive::ArchiveInteractionResult<services::archive::InteractionArchiveDetails>;
    using RestoreResult = services::archive::RestoreInteractionResult<models::Interaction>;

    StubInteractionArchiver(std::string name,
                            std::function<bool(const models::Interaction&)> archive_predicate,
                            std::function<bool(const models::ChatItem&)> restore_predicate);

    std::string GetArchiverName() const override { return name_; }

    bool CanArchiveInteraction(const models::Interaction& interaction) const override;
    bool CanRestoreChatItem(const models::ChatItem& chat_item) const override;

    ArchiveResult ArchiveInteraction(const models::Interaction& interaction,
                                     const services::archive::ChatArchivingContext& context,
                                     const core::db::ReadTransaction& tx) override;

    RestoreResult RestoreChatItem(const models::ChatItem& chat_item,
                                  const models::Thread& thread,
                                  const services::archive::ChatRestoringContext& context,
                                  core::db::WriteTransaction& tx) override;

    std::function<ArchiveResult(const models::Interaction&)> archive_handler;
    std::function<RestoreResult(const models::ChatItem&, const models::Thread&)> restore_handler;

    size_t archive_calls = 0;
    size_t restore_calls = 0;

private:
    std::string name_;
    std::function<bool(const models::Interaction&)> archive_predicate_;
    std::function<bool(const models::ChatItem&)> restore_predicate_;
};

// 测试数据构造

models::Interaction MakeIncomingMessage(uint64_t timestamp,
                                        const std::string& thread_id,
                                        const std::string& author_address,
                                        const std::string& body);

models::Interaction MakeOutgoingMessage(uint64_t timestamp,
                                        const std::string& thread_id,
                                        const std::string& body);

services::archive::InteractionArchiveDetails MakeStandardDetails(const std::string& text);

} // namespace chat_backup::tests
