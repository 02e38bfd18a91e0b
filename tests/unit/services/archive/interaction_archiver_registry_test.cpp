#include <gtest/gtest.h>
#include <memory>

#include "fakes/fake_stores.h"
#include "services/archive/interaction_archiver_registry.h"
#include "services/archive/reaction_archiver.h"

namespace chat_backup::tests {

using namespace services::archive;

namespace {

bool AnyInteraction(const models::Interaction&) { return true; }
bool NoInteraction(const models::Interaction&) { return false; }
bool AnyChatItem(const models::ChatItem&) { return true; }
bool NoChatItem(const models::ChatItem&) { return false; }

} // namespace

TEST(InteractionArchiverRegistryTest, DefaultRegistryOrder) {
    InMemoryInteractionStore interaction_store;
    InMemoryReactionStore reaction_store;
    auto contents_archiver = std::make_shared<MessageContentsArchiver>(
        std::make_shared<ReactionArchiver>(reaction_store));

    auto registry = InteractionArchiverRegistry::CreateDefault(contents_archiver, interaction_store);

    auto names = registry.GetRegisteredArchivers();
    ASSERT_EQ(names.size(), 3u);
    EXPECT_EQ(names[0], "incoming_message");
    EXPECT_EQ(names[1], "outgoing_message");
    EXPECT_EQ(names[2], "info_message");
}

TEST(InteractionArchiverRegistryTest, DefaultRegistryDispatchesByKind) {
    InMemoryInteractionStore interaction_store;
    InMemoryReactionStore reaction_store;
    auto contents_archiver = std::make_shared<MessageContentsArchiver>(
        std::make_shared<ReactionArchiver>(reaction_store));
    auto registry = InteractionArchiverRegistry::CreateDefault(contents_archiver, interaction_store);

    auto incoming = registry.FindForInteraction(MakeIncomingMessage(1, "t", "+1", "a"));
    ASSERT_NE(incoming, nullptr);
    EXPECT_EQ(incoming->GetArchiverName(), "incoming_message");

    auto outgoing = registry.FindForInteraction(MakeOutgoingMessage(2, "t", "b"));
    ASSERT_NE(outgoing, nullptr);
    EXPECT_EQ(outgoing->GetArchiverName(), "outgoing_message");

    models::Interaction call;
    call.kind = models::InteractionKind::kCall;
    EXPECT_EQ(registry.FindForInteraction(call), nullptr);

    models::ChatItem update;
    update.directional_details = models::DirectionlessMessageDetails{};
    update.payload = models::ChatUpdateMessage{models::InfoMessageType::kProfileChanged, ""};
    auto info = registry.FindForChatItem(update);
    ASSERT_NE(info, nullptr);
    EXPECT_EQ(info->GetArchiverName(), "info_message");
}

TEST(InteractionArchiverRegistryTest, FirstMatchWins) {
    auto first = std::make_shared<StubInteractionArchiver>("first", AnyInteraction, AnyChatItem);
    auto second = std::make_shared<StubInteractionArchiver>("second", AnyInteraction, AnyChatItem);

    InteractionArchiverRegistry registry;
    registry.Register(first);
    registry.Register(second);

    EXPECT_EQ(registry.FindForInteraction(models::Interaction{}), first);
    EXPECT_EQ(registry.FindForChatItem(models::ChatItem{}), first);
}

TEST(InteractionArchiverRegistryTest, SkipsArchiversThatDecline) {
    auto declining = std::make_shared<StubInteractionArchiver>("declining", NoInteraction, NoChatItem);
    auto accepting = std::make_shared<StubInteractionArchiver>("accepting", AnyInteraction, AnyChatItem);

    InteractionArchiverRegistry registry;
    registry.Register(declining);
    registry.Register(accepting);

    EXPECT_EQ(registry.FindForInteraction(models::Interaction{}), accepting);
    EXPECT_EQ(registry.FindForChatItem(models::ChatItem{}), accepting);
    // 匹配检查不会调用归档方法
    EXPECT_EQ(declining->archive_calls, 0u);
    EXPECT_EQ(accepting->archive_calls, 0u);
}

TEST(InteractionArchiverRegistryTest, EmptyRegistryMatchesNothing) {
    InteractionArchiverRegistry registry;

    EXPECT_EQ(registry.Size(), 0u);
    EXPECT_EQ(registry.FindForInteraction(models::Interaction{}), nullptr);
    EXPECT_EQ(registry.FindForChatItem(models::ChatItem{}), nullptr);
}

TEST(InteractionArchiverRegistryTest, NullArchiverIsIgnored) {
    InteractionArchiverRegistry registry;
    registry.Register(nullptr);

    EXPECT_EQ(registry.Size(), 0u);
}

} // namespace chat_backup::tests
