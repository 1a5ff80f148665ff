// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <geminimcp/conversation_store.hpp>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

using namespace geminimcp;

TEST(ConversationStoreTest, UnknownSessionIsEmpty)
{
    InMemoryConversationStore store;
    EXPECT_TRUE(store.history("s1").empty());
    EXPECT_FALSE(store.contains("s1"));
    EXPECT_EQ(store.session_count(), 0u);
}

TEST(ConversationStoreTest, AppendKeepsOrder)
{
    InMemoryConversationStore store;
    store.append("s1", {ConversationTurn::text(Role::User, "hi"), ConversationTurn::text(Role::Model, "hello")});
    store.append("s1", {ConversationTurn::text(Role::User, "again")});

    auto history = store.history("s1");
    ASSERT_EQ(history.size(), 3u);
    EXPECT_EQ(history[0].role, Role::User);
    EXPECT_EQ(history[1].role, Role::Model);
    EXPECT_EQ(std::get<TextPart>(history[2].parts[0]).text, "again");
    EXPECT_TRUE(store.contains("s1"));
}

TEST(ConversationStoreTest, SessionsAreIsolated)
{
    InMemoryConversationStore store;
    store.append("a", {ConversationTurn::text(Role::User, "for a")});
    store.append("b", {ConversationTurn::text(Role::User, "for b")});

    EXPECT_EQ(store.session_count(), 2u);
    EXPECT_EQ(std::get<TextPart>(store.history("a")[0].parts[0]).text, "for a");
    EXPECT_EQ(std::get<TextPart>(store.history("b")[0].parts[0]).text, "for b");
}

TEST(ConversationStoreTest, EvictRemovesHistory)
{
    InMemoryConversationStore store;
    store.append("s1", {ConversationTurn::text(Role::User, "hi")});

    EXPECT_TRUE(store.evict("s1"));
    EXPECT_FALSE(store.contains("s1"));
    EXPECT_FALSE(store.evict("s1"));
}

TEST(ConversationStoreTest, HistoryIsASnapshot)
{
    InMemoryConversationStore store;
    store.append("s1", {ConversationTurn::text(Role::User, "one")});

    auto snapshot = store.history("s1");
    store.append("s1", {ConversationTurn::text(Role::Model, "two")});
    EXPECT_EQ(snapshot.size(), 1u);
}

TEST(ConversationStoreTest, SessionLockSerializesSameSession)
{
    InMemoryConversationStore store;
    std::atomic<bool> second_entered{false};

    auto first = store.lock_session("s1");
    std::thread other(
        [&]
        {
            auto lock = store.lock_session("s1");
            second_entered = true;
        }
    );

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(second_entered);

    first.unlock();
    other.join();
    EXPECT_TRUE(second_entered);
}

TEST(ConversationStoreTest, SessionLocksAreIndependent)
{
    InMemoryConversationStore store;
    auto a = store.lock_session("a");

    std::atomic<bool> b_locked{false};
    std::thread other(
        [&]
        {
            auto lock = store.lock_session("b");
            b_locked = true;
        }
    );
    other.join();
    EXPECT_TRUE(b_locked);
}

TEST(ConversationStoreTest, TurnSerializesToProviderFormat)
{
    ConversationTurn turn;
    turn.role = Role::User;
    turn.parts.push_back(TextPart{"look"});
    turn.parts.push_back(InlineDataPart{"image/png", "AAAA"});

    json j = turn;
    EXPECT_EQ(j["role"], "user");
    EXPECT_EQ(j["parts"][0]["text"], "look");
    EXPECT_EQ(j["parts"][1]["inlineData"]["mimeType"], "image/png");
    EXPECT_EQ(j["parts"][1]["inlineData"]["data"], "AAAA");

    auto back = j.get<ConversationTurn>();
    ASSERT_EQ(back.parts.size(), 2u);
    EXPECT_EQ(std::get<InlineDataPart>(back.parts[1]).mime_type, "image/png");
}
