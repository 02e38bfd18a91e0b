#include <gtest/gtest.h>
#include <limits>
#include <memory>

#include "common/types.h"
#include "fakes/fake_stores.h"
#include "services/archive/chat_item_archiver.h"
#include "services/archive/message_contents_archiver.h"
#include "services/archive/reaction_archiver.h"

namespace chat_backup::tests {

using namespace services::archive;

namespace {

constexpr uint64_t kNow = 1700000000000;
constexpr uint64_t kDay = 24ULL * 60 * 60 * 1000;

const char* const kAlice = "+15550002";

} // namespace

class ChatItemArchiverTest : public ::testing::Test {
protected:
    void SetUp() override {
        context_.SetLocalRecipientId(models::RecipientId{1});
        context_.MapRecipient("+15550001", models::RecipientId{1});
        context_.MapRecipient(kAlice, models::RecipientId{2});
        context_.MapThread(models::ThreadUniqueId{"thread-a"}, models::ChatId{7});

        options_ = ChatItemArchiverOptions::Defaults();
    }

    InteractionArchiverRegistry DefaultRegistry() {
        auto reaction_archiver = std::make_shared<ReactionArchiver>(reaction_store_);
        auto contents_archiver = std::make_shared<MessageContentsArchiver>(reaction_archiver);
        return InteractionArchiverRegistry::CreateDefault(contents_archiver, interaction_store_);
    }

    std::unique_ptr<ChatItemArchiver> MakeArchiver(InteractionArchiverRegistry registry) {
        return std::make_unique<ChatItemArchiver>(
            [] { return common::types::FromMillisecondsSince1970(kNow); },
            interaction_store_, thread_store_, std::move(registry), options_);
    }

    std::unique_ptr<ChatItemArchiver> MakeArchiver() {
        return MakeArchiver(DefaultRegistry());
    }

    InMemoryInteractionStore interaction_store_;
    InMemoryThreadStore thread_store_;
    InMemoryReactionStore reaction_store_;
    ChatArchivingContext context_;
    RecordingOutputStream stream_;
    FakeTransaction tx_;
    ChatItemArchiverOptions options_;
};

TEST_F(ChatItemArchiverTest, EmptyStoreSucceedsWithoutFrames) {
    auto archiver = MakeArchiver();

    auto result = archiver->ArchiveInteractions(stream_, context_, tx_);

    EXPECT_TRUE(result.IsSuccess());
    EXPECT_TRUE(stream_.frames.empty());
    EXPECT_EQ(archiver->GetLastArchiveStats().enumerated, 0u);
}

TEST_F(ChatItemArchiverTest, MissingThreadIsPartialErrorAndOtherItemsAreWritten) {
    interaction_store_.interactions = {
        MakeIncomingMessage(1000, "thread-a", kAlice, "hello"),
        MakeIncomingMessage(2000, "thread-gone", kAlice, "lost")
    };
    auto archiver = MakeArchiver();

    auto result = archiver->ArchiveInteractions(stream_, context_, tx_);

    ASSERT_TRUE(result.IsPartialSuccess());
    ASSERT_EQ(result.GetErrors().size(), 1u);
    const auto& error = result.GetErrors()[0];
    EXPECT_EQ(error.type, ArchiveFrameError::Type::kReferencedIdMissing);
    EXPECT_EQ(error.object_id, "chat_item:2000");
    EXPECT_EQ(error.detail, "thread:thread-gone");

    auto chat_items = stream_.ChatItems();
    ASSERT_EQ(chat_items.size(), 1u);
    EXPECT_EQ(chat_items[0].chat_id, models::ChatId{7});
    EXPECT_EQ(chat_items[0].author_id, models::RecipientId{2});
    EXPECT_EQ(chat_items[0].date_sent, 1000u);
    EXPECT_EQ(std::get<models::StandardMessage>(chat_items[0].payload).text, "hello");
}

TEST_F(ChatItemArchiverTest, EveryInteractionIsAccountedFor) {
    auto past_revision = MakeIncomingMessage(3000, "thread-a", kAlice, "old text");
    past_revision.edit_state = models::EditState::kPastRevision;

    auto call = MakeIncomingMessage(4000, "thread-a", kAlice, "");
    call.kind = models::InteractionKind::kCall;

    auto expiring = MakeIncomingMessage(5000, "thread-a", kAlice, "soon gone");
    expiring.expire_started_at = kNow;
    expiring.expires_in_seconds = 60;

    auto unknown_author = MakeIncomingMessage(6000, "thread-a", "+19999999", "who?");

    interaction_store_.interactions = {
        MakeIncomingMessage(1000, "thread-a", kAlice, "written"),
        MakeIncomingMessage(2000, "thread-gone", kAlice, "no chat"),
        past_revision,
        call,
        expiring,
        unknown_author
    };
    auto archiver = MakeArchiver();

    auto result = archiver->ArchiveInteractions(stream_, context_, tx_);

    ASSERT_TRUE(result.IsPartialSuccess());
    EXPECT_EQ(result.GetErrors().size(), 2u);

    const auto& stats = archiver->GetLastArchiveStats();
    EXPECT_EQ(stats.enumerated, 6u);
    EXPECT_EQ(stats.frames_written, 1u);
    EXPECT_EQ(stats.skipped, 3u);
    EXPECT_EQ(stats.failed, 2u);
    EXPECT_EQ(stats.frames_written + stats.skipped + stats.failed, stats.enumerated);
}

TEST_F(ChatItemArchiverTest, CursorOpenFailureIsCompleteFailure) {
    interaction_store_.open_error = "database is locked";
    auto archiver = MakeArchiver();

    auto result = archiver->ArchiveInteractions(stream_, context_, tx_);

    ASSERT_TRUE(result.IsCompleteFailure());
    EXPECT_EQ(result.GetFatalError().message, "database is locked");
}

TEST_F(ChatItemArchiverTest, EnumerationFailureStopsThePass) {
    interaction_store_.interactions = {
        MakeIncomingMessage(1000, "thread-a", kAlice, "first"),
        MakeIncomingMessage(2000, "thread-a", kAlice, "second")
    };
    interaction_store_.fail_after = 1;
    auto archiver = MakeArchiver();

    auto result = archiver->ArchiveInteractions(stream_, context_, tx_);

    ASSERT_TRUE(result.IsCompleteFailure());
    EXPECT_EQ(result.GetFatalError().message, "enumeration failed");
    EXPECT_EQ(stream_.frames.size(), 1u);
}

TEST_F(ChatItemArchiverTest, CompleteFailureFromArchiverShortCircuits) {
    auto stub = std::make_shared<StubInteractionArchiver>(
        "stub",
        [](const models::Interaction&) { return true; },
        nullptr);
    stub->archive_handler = [](const models::Interaction& interaction) {
        if (interaction.timestamp == 2000) {
            return StubInteractionArchiver::ArchiveResult::CompleteFailure(FatalArchiveError{"corrupt store"});
        }
        return StubInteractionArchiver::ArchiveResult::Success(MakeStandardDetails(interaction.body));
    };

    InteractionArchiverRegistry registry;
    registry.Register(stub);

    interaction_store_.interactions = {
        MakeIncomingMessage(1000, "thread-a", kAlice, "one"),
        MakeIncomingMessage(2000, "thread-a", kAlice, "two"),
        MakeIncomingMessage(3000, "thread-a", kAlice, "three")
    };
    auto archiver = MakeArchiver(std::move(registry));

    auto result = archiver->ArchiveInteractions(stream_, context_, tx_);

    ASSERT_TRUE(result.IsCompleteFailure());
    EXPECT_EQ(result.GetFatalError().message, "corrupt store");
    EXPECT_EQ(stub->archive_calls, 2u);
    EXPECT_EQ(stream_.frames.size(), 1u);
}

TEST_F(ChatItemArchiverTest, RetentionBoundary) {
    const uint64_t expires_in_seconds = 3600;
    const uint64_t expires_in_ms = expires_in_seconds * 1000;
    const uint64_t min_expire_time = kNow + kDay;

    // 恰好在 now + 24h 过期的消息保留
    auto at_boundary = MakeIncomingMessage(1000, "thread-a", kAlice, "kept");
    at_boundary.expire_started_at = min_expire_time - expires_in_ms;
    at_boundary.expires_in_seconds = expires_in_seconds;

    // 早 1 毫秒过期的消息跳过
    auto before_boundary = MakeIncomingMessage(2000, "thread-a", kAlice, "dropped");
    before_boundary.expire_started_at = min_expire_time - expires_in_ms - 1;
    before_boundary.expires_in_seconds = expires_in_seconds;

    interaction_store_.interactions = {at_boundary, before_boundary};
    auto archiver = MakeArchiver();

    auto result = archiver->ArchiveInteractions(stream_, context_, tx_);

    EXPECT_TRUE(result.IsSuccess());
    auto chat_items = stream_.ChatItems();
    ASSERT_EQ(chat_items.size(), 1u);
    EXPECT_EQ(chat_items[0].date_sent, 1000u);
    EXPECT_EQ(chat_items[0].expire_start_date, at_boundary.expire_started_at);
    EXPECT_EQ(chat_items[0].expires_in_ms, expires_in_ms);
    EXPECT_EQ(archiver->GetLastArchiveStats().skipped, 1u);
}

TEST_F(ChatItemArchiverTest, TimerNotStartedIsNeverSkipped) {
    auto message = MakeIncomingMessage(1000, "thread-a", kAlice, "unread disappearing");
    message.expires_in_seconds = 10;

    interaction_store_.interactions = {message};
    auto archiver = MakeArchiver();

    auto result = archiver->ArchiveInteractions(stream_, context_, tx_);

    EXPECT_TRUE(result.IsSuccess());
    auto chat_items = stream_.ChatItems();
    ASSERT_EQ(chat_items.size(), 1u);
    EXPECT_FALSE(chat_items[0].expire_start_date.has_value());
    EXPECT_EQ(chat_items[0].expires_in_ms, 10000u);
}

TEST_F(ChatItemArchiverTest, MinExpireTimerIsConfigurable) {
    options_.min_expire_timer_ms = 0;

    auto message = MakeIncomingMessage(1000, "thread-a", kAlice, "still alive");
    message.expire_started_at = kNow;
    message.expires_in_seconds = 60;

    interaction_store_.interactions = {message};
    auto archiver = MakeArchiver();

    archiver->ArchiveInteractions(stream_, context_, tx_);

    EXPECT_EQ(stream_.ChatItems().size(), 1u);
}

TEST_F(ChatItemArchiverTest, DeclaredZeroDurationIsAlreadyExpired) {
    auto stub = std::make_shared<StubInteractionArchiver>(
        "stub",
        [](const models::Interaction&) { return true; },
        nullptr);
    stub->archive_handler = [](const models::Interaction& interaction) {
        auto details = MakeStandardDetails(interaction.body);
        details.expire_start_date = kNow - 1000;
        details.expires_in_ms = 0;
        return StubInteractionArchiver::ArchiveResult::Success(std::move(details));
    };

    InteractionArchiverRegistry registry;
    registry.Register(stub);

    interaction_store_.interactions = {MakeIncomingMessage(1000, "thread-a", kAlice, "gone")};
    auto archiver = MakeArchiver(std::move(registry));

    auto result = archiver->ArchiveInteractions(stream_, context_, tx_);

    EXPECT_TRUE(result.IsSuccess());
    EXPECT_TRUE(stream_.ChatItems().empty());
    EXPECT_EQ(archiver->GetLastArchiveStats().skipped, 1u);
}

TEST_F(ChatItemArchiverTest, HugeMinExpireTimerDoesNotWrap) {
    options_.min_expire_timer_ms = std::numeric_limits<uint64_t>::max() - 10;

    auto message = MakeIncomingMessage(1000, "thread-a", kAlice, "short timer");
    message.expire_started_at = kNow;
    message.expires_in_seconds = 60;

    interaction_store_.interactions = {message};
    auto archiver = MakeArchiver();

    auto result = archiver->ArchiveInteractions(stream_, context_, tx_);

    EXPECT_TRUE(result.IsSuccess());
    EXPECT_TRUE(stream_.ChatItems().empty());
    EXPECT_EQ(archiver->GetLastArchiveStats().skipped, 1u);
}

TEST_F(ChatItemArchiverTest, HugeDeclaredDurationDoesNotWrap) {
    auto stub = std::make_shared<StubInteractionArchiver>(
        "stub",
        [](const models::Interaction&) { return true; },
        nullptr);
    stub->archive_handler = [](const models::Interaction& interaction) {
        auto details = MakeStandardDetails(interaction.body);
        details.expire_start_date = kNow;
        details.expires_in_ms = std::numeric_limits<uint64_t>::max() - 5;
        return StubInteractionArchiver::ArchiveResult::Success(std::move(details));
    };

    InteractionArchiverRegistry registry;
    registry.Register(stub);

    interaction_store_.interactions = {MakeIncomingMessage(1000, "thread-a", kAlice, "kept")};
    auto archiver = MakeArchiver(std::move(registry));

    auto result = archiver->ArchiveInteractions(stream_, context_, tx_);

    EXPECT_TRUE(result.IsSuccess());
    EXPECT_EQ(stream_.ChatItems().size(), 1u);
}

TEST_F(ChatItemArchiverTest, UnsupportedInteractionIsSkippedEveryTime) {
    auto call = MakeIncomingMessage(1000, "thread-a", kAlice, "");
    call.kind = models::InteractionKind::kCall;
    interaction_store_.interactions = {call};
    auto archiver = MakeArchiver();

    auto first = archiver->ArchiveInteractions(stream_, context_, tx_);
    auto second = archiver->ArchiveInteractions(stream_, context_, tx_);

    EXPECT_TRUE(first.IsSuccess());
    EXPECT_TRUE(second.IsSuccess());
    EXPECT_TRUE(stream_.frames.empty());
    EXPECT_EQ(archiver->GetLastArchiveStats().skipped, 1u);
}

TEST_F(ChatItemArchiverTest, StrictModeReportsUnsupportedInteraction) {
    options_.strict_unsupported = true;

    auto story = MakeIncomingMessage(1000, "thread-a", kAlice, "");
    story.kind = models::InteractionKind::kStoryMessage;
    interaction_store_.interactions = {story};
    auto archiver = MakeArchiver();

    auto result = archiver->ArchiveInteractions(stream_, context_, tx_);

    ASSERT_TRUE(result.IsPartialSuccess());
    ASSERT_EQ(result.GetErrors().size(), 1u);
    EXPECT_EQ(result.GetErrors()[0].type, ArchiveFrameError::Type::kUnsupportedInteraction);
    EXPECT_EQ(result.GetErrors()[0].detail, "story_message");
}

TEST_F(ChatItemArchiverTest, MessageFailureDoesNotStopLaterItems) {
    interaction_store_.interactions = {
        MakeIncomingMessage(1000, "thread-a", "+19999999", "stranger"),
        MakeIncomingMessage(2000, "thread-a", kAlice, "friend")
    };
    auto archiver = MakeArchiver();

    auto result = archiver->ArchiveInteractions(stream_, context_, tx_);

    ASSERT_TRUE(result.IsPartialSuccess());
    ASSERT_EQ(result.GetErrors().size(), 1u);
    EXPECT_EQ(result.GetErrors()[0].type, ArchiveFrameError::Type::kReferencedIdMissing);
    EXPECT_EQ(result.GetErrors()[0].detail, "recipient:+19999999");

    auto chat_items = stream_.ChatItems();
    ASSERT_EQ(chat_items.size(), 1u);
    EXPECT_EQ(chat_items[0].date_sent, 2000u);
}

TEST_F(ChatItemArchiverTest, PartialFailureStillWritesFrame) {
    auto outgoing = MakeOutgoingMessage(1000, "thread-a", "to everyone");
    outgoing.recipient_states = {
        {kAlice, models::DeliveryStatus::kDelivered, 1100},
        {"+19999999", models::DeliveryStatus::kSent, 1050}
    };
    interaction_store_.interactions = {outgoing};
    auto archiver = MakeArchiver();

    auto result = archiver->ArchiveInteractions(stream_, context_, tx_);

    ASSERT_TRUE(result.IsPartialSuccess());
    ASSERT_EQ(result.GetErrors().size(), 1u);

    auto chat_items = stream_.ChatItems();
    ASSERT_EQ(chat_items.size(), 1u);
    EXPECT_EQ(chat_items[0].author_id, models::RecipientId{1});
    const auto& details = std::get<models::OutgoingMessageDetails>(chat_items[0].directional_details);
    ASSERT_EQ(details.send_status.size(), 1u);
    EXPECT_EQ(details.send_status[0].recipient_id, models::RecipientId{2});
    EXPECT_EQ(details.send_status[0].status, models::DeliveryStatus::kDelivered);
}

TEST_F(ChatItemArchiverTest, FrameWriteFailureIsTaggedWithItemId) {
    stream_.fail_when = [](const models::Frame& frame) {
        const auto* chat_item = std::get_if<models::ChatItem>(&frame.item);
        return chat_item != nullptr && chat_item->date_sent == 1000;
    };
    interaction_store_.interactions = {
        MakeIncomingMessage(1000, "thread-a", kAlice, "unlucky"),
        MakeIncomingMessage(2000, "thread-a", kAlice, "lucky")
    };
    auto archiver = MakeArchiver();

    auto result = archiver->ArchiveInteractions(stream_, context_, tx_);

    ASSERT_TRUE(result.IsPartialSuccess());
    ASSERT_EQ(result.GetErrors().size(), 1u);
    EXPECT_EQ(result.GetErrors()[0].type, ArchiveFrameError::Type::kFrameWriteFailed);
    EXPECT_EQ(result.GetErrors()[0].object_id, "chat_item:1000");
    EXPECT_EQ(result.GetErrors()[0].detail, "disk full");
    EXPECT_EQ(stream_.frames.size(), 1u);
    EXPECT_EQ(stream_.write_attempts, 2u);
}

TEST_F(ChatItemArchiverTest, UnknownInfoMessageIsSkipped) {
    models::Interaction info;
    info.unique_id = "info-1";
    info.unique_thread_id = "thread-a";
    info.timestamp = 1000;
    info.kind = models::InteractionKind::kInfoMessage;
    info.info_type = models::InfoMessageType::kUnknown;

    interaction_store_.interactions = {info};
    auto archiver = MakeArchiver();

    auto result = archiver->ArchiveInteractions(stream_, context_, tx_);

    EXPECT_TRUE(result.IsSuccess());
    EXPECT_TRUE(stream_.frames.empty());
}

TEST_F(ChatItemArchiverTest, EditedMessageCarriesRevisionsInSameChat) {
    auto latest = MakeIncomingMessage(2000, "thread-a", kAlice, "fixed typo");
    latest.edit_state = models::EditState::kLatestRevision;

    auto past = MakeIncomingMessage(1000, "thread-a", kAlice, "fixd typo");
    past.unique_id = "msg-old";
    past.edit_state = models::EditState::kPastRevision;
    past.latest_revision_id = latest.unique_id;

    interaction_store_.interactions = {past, latest};
    interaction_store_.past_revisions[latest.unique_id] = {past};
    auto archiver = MakeArchiver();

    auto result = archiver->ArchiveInteractions(stream_, context_, tx_);

    EXPECT_TRUE(result.IsSuccess());
    auto chat_items = stream_.ChatItems();
    ASSERT_EQ(chat_items.size(), 1u);
    ASSERT_EQ(chat_items[0].revisions.size(), 1u);
    EXPECT_EQ(chat_items[0].revisions[0].chat_id, models::ChatId{7});
    EXPECT_EQ(chat_items[0].revisions[0].date_sent, 1000u);
    EXPECT_EQ(std::get<models::StandardMessage>(chat_items[0].revisions[0].payload).text, "fixd typo");
}

TEST_F(ChatItemArchiverTest, OptionsFromConfig) {
    auto& config = core::config::ConfigManager::GetInstance();
    config.Clear();
    config.Set("backup.min_expire_timer_ms", int64_t{5000});
    config.Set("archive.strict_unsupported", true);

    auto options = ChatItemArchiverOptions::FromConfig(config);

    EXPECT_EQ(options.min_expire_timer_ms, 5000u);
    EXPECT_TRUE(options.strict_unsupported);
    EXPECT_FALSE(options.preserve_partial_restore);

    config.Clear();
    EXPECT_EQ(ChatItemArchiverOptions::FromConfig(config).min_expire_timer_ms, kDay);
}

} // namespace chat_backup::tests
