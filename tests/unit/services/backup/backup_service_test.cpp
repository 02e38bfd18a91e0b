#include <gtest/gtest.h>
#include <memory>
#include <sstream>

#include "fakes/fake_stores.h"
#include "services/archive/message_contents_archiver.h"
#include "services/archive/reaction_archiver.h"
#include "services/backup/backup_service.h"

namespace chat_backup::tests {

using namespace services::archive;
using services::backup::BackupService;

namespace {

constexpr const char* kLocalAddress = "+15550001";

// 一套完整的存储与归档器
struct BackupFixture {
    InMemoryInteractionStore interaction_store;
    InMemoryThreadStore thread_store;
    InMemoryReactionStore reaction_store;

    ChatArchiver chat_archiver{thread_store};
    std::unique_ptr<ChatItemArchiver> chat_item_archiver;
    std::unique_ptr<BackupService> service;

    BackupFixture() {
        auto contents_archiver = std::make_shared<MessageContentsArchiver>(
            std::make_shared<ReactionArchiver>(reaction_store));
        chat_item_archiver = std::make_unique<ChatItemArchiver>(
            [] { return std::chrono::system_clock::now(); },
            interaction_store, thread_store,
            InteractionArchiverRegistry::CreateDefault(contents_archiver, interaction_store),
            ChatItemArchiverOptions::Defaults());
        service = std::make_unique<BackupService>(chat_archiver, *chat_item_archiver);
    }
};

} // namespace

class BackupServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        models::Thread thread;
        thread.unique_id = "thread-a";
        thread.participant_addresses = {"+15550002"};
        source_.thread_store.threads.push_back(thread);

        auto incoming = MakeIncomingMessage(1000, "thread-a", "+15550002", "hi there");
        auto outgoing = MakeOutgoingMessage(2000, "thread-a", "hello back");
        outgoing.recipient_states = {{"+15550002", models::DeliveryStatus::kRead, 2100}};

        models::Interaction update;
        update.unique_id = "info-1";
        update.unique_thread_id = "thread-a";
        update.timestamp = 3000;
        update.kind = models::InteractionKind::kInfoMessage;
        update.info_type = models::InfoMessageType::kSafetyNumberChanged;

        source_.interaction_store.interactions = {incoming, outgoing, update};
        source_.reaction_store.reactions.push_back(
            models::Reaction{incoming.unique_id, kLocalAddress, "👍", 1500, 1600});
    }

    BackupFixture source_;
    BackupFixture target_;
    FakeTransaction tx_;
};

TEST_F(BackupServiceTest, ExportThenImportRestoresEverything) {
    std::stringstream buffer;
    JsonlBackupOutputStream output(buffer);

    auto export_result = source_.service->Export(output, kLocalAddress, tx_);
    ASSERT_TRUE(export_result.IsSuccess());
    // 本机用户、一个联系人、一个会话、三条聊天记录
    EXPECT_EQ(output.GetFramesWritten(), 6u);

    JsonlBackupInputStream input(buffer);
    auto summary = target_.service->Import(input, tx_);

    EXPECT_TRUE(summary.IsComplete());
    EXPECT_EQ(summary.frames_read, 6u);
    EXPECT_EQ(summary.recipients_restored, 2u);
    EXPECT_EQ(summary.chats_restored, 1u);
    EXPECT_EQ(summary.chat_items_restored, 3u);

    ASSERT_EQ(target_.thread_store.threads.size(), 1u);
    const auto& restored_thread = target_.thread_store.threads[0];
    EXPECT_NE(restored_thread.unique_id, "thread-a");
    EXPECT_EQ(restored_thread.participant_addresses, std::vector<std::string>{"+15550002"});

    const auto& restored = target_.interaction_store.inserted;
    ASSERT_EQ(restored.size(), 3u);
    EXPECT_EQ(restored[0].kind, models::InteractionKind::kIncomingMessage);
    EXPECT_EQ(restored[0].body, "hi there");
    EXPECT_EQ(restored[0].unique_thread_id, restored_thread.unique_id);
    EXPECT_EQ(restored[1].kind, models::InteractionKind::kOutgoingMessage);
    ASSERT_EQ(restored[1].recipient_states.size(), 1u);
    EXPECT_EQ(restored[1].recipient_states[0].status, models::DeliveryStatus::kRead);
    EXPECT_EQ(restored[2].info_type, models::InfoMessageType::kSafetyNumberChanged);

    ASSERT_EQ(target_.reaction_store.inserted.size(), 1u);
    EXPECT_EQ(target_.reaction_store.inserted[0].reactor_address, kLocalAddress);
    EXPECT_EQ(target_.reaction_store.inserted[0].unique_message_id, restored[0].unique_id);
}

TEST_F(BackupServiceTest, ExportStopsOnThreadEnumerationFailure) {
    source_.thread_store.enumerate_error = "connection reset";
    RecordingOutputStream output;

    auto result = source_.service->Export(output, kLocalAddress, tx_);

    ASSERT_TRUE(result.IsCompleteFailure());
    EXPECT_EQ(source_.interaction_store.items_yielded, 0u);
}

TEST_F(BackupServiceTest, ExportMergesChatAndItemErrors) {
    source_.interaction_store.interactions.push_back(
        MakeIncomingMessage(4000, "thread-a", "+15550002", ""));
    RecordingOutputStream output;
    output.fail_when = [](const models::Frame& frame) {
        const auto* recipient = std::get_if<models::RecipientFrame>(&frame.item);
        return recipient != nullptr && recipient->is_self;
    };

    auto result = source_.service->Export(output, kLocalAddress, tx_);

    ASSERT_TRUE(result.IsPartialSuccess());
    const auto& errors = result.GetErrors();
    ASSERT_GE(errors.size(), 2u);
    EXPECT_EQ(errors.front().type, ArchiveFrameError::Type::kFrameWriteFailed);
    EXPECT_EQ(errors.back().type, ArchiveFrameError::Type::kMessageContentMissing);
}

TEST_F(BackupServiceTest, ImportCountsFailuresAndContinues) {
    QueuedInputStream input;
    input.frames.push_back(models::Frame{models::RecipientFrame{models::RecipientId{1}, kLocalAddress, true}});
    input.frames.push_back(models::Frame{models::RecipientFrame{models::RecipientId{2}, "", false}});

    models::ChatFrame chat;
    chat.id = models::ChatId{1};
    chat.participant_ids = {models::RecipientId{1}};
    input.frames.push_back(models::Frame{chat});

    models::ChatItem orphan;
    orphan.chat_id = models::ChatId{5};
    orphan.author_id = models::RecipientId{1};
    orphan.date_sent = 1000;
    orphan.directional_details = models::OutgoingMessageDetails{};
    orphan.payload = models::StandardMessage{"lost", {}, {}};
    input.frames.push_back(models::Frame{orphan});

    models::ChatItem kept = orphan;
    kept.chat_id = models::ChatId{1};
    kept.date_sent = 2000;
    input.frames.push_back(models::Frame{kept});

    auto summary = target_.service->Import(input, tx_);

    EXPECT_FALSE(summary.IsComplete());
    EXPECT_FALSE(summary.fatal_error.has_value());
    EXPECT_EQ(summary.frames_read, 5u);
    EXPECT_EQ(summary.recipients_restored, 1u);
    EXPECT_EQ(summary.chats_restored, 1u);
    EXPECT_EQ(summary.chat_items_restored, 1u);
    EXPECT_EQ(summary.failures, 2u);
    ASSERT_EQ(summary.problems.size(), 2u);
    EXPECT_EQ(summary.problems[0].GetObjectId(), "recipient:2");
    EXPECT_EQ(summary.problems[1].GetObjectId(), "chat_item:1000");
}

TEST_F(BackupServiceTest, ImportStopsAtUnreadableFrame) {
    QueuedInputStream input;
    input.frames.push_back(models::Frame{models::RecipientFrame{models::RecipientId{1}, kLocalAddress, true}});
    input.trailing_error = "第 2 行数据无效";

    auto summary = target_.service->Import(input, tx_);

    ASSERT_TRUE(summary.fatal_error.has_value());
    EXPECT_EQ(*summary.fatal_error, "第 2 行数据无效");
    EXPECT_EQ(summary.frames_read, 1u);
    EXPECT_EQ(summary.recipients_restored, 1u);
    EXPECT_FALSE(summary.IsComplete());
}

} // namespace chat_backup::tests
