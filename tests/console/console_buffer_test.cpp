// Orexa - Game Server Supervisor
// Tests for the console history buffer and subscriber channels

#include <gtest/gtest.h>
#include "orexa/console/console_buffer.hpp"

#include <chrono>
#include <string>
#include <thread>

namespace orexa {
namespace console {
namespace test {

class ConsoleBufferTest : public ::testing::Test {
protected:
    void fill(ConsoleBuffer& buffer, int count) {
        for (int i = 0; i < count; i++) {
            buffer.broadcast(buffer.append("line " + std::to_string(i + 1)));
        }
    }
};

// =============================================================================
// History
// =============================================================================

TEST_F(ConsoleBufferTest, SequencesStartAtOneAndIncrease) {
    ConsoleBuffer buffer(10, 2, 10);

    EXPECT_EQ(buffer.append("a").seq, 1u);
    EXPECT_EQ(buffer.append("b").seq, 2u);
    EXPECT_EQ(buffer.nextSequence(), 3u);
}

TEST_F(ConsoleBufferTest, TrimsOldestBatchPastCapacity) {
    ConsoleBuffer buffer(5, 2, 10);
    fill(buffer, 5);
    ASSERT_EQ(buffer.entries().size(), 5u);

    buffer.append("line 6");

    ASSERT_EQ(buffer.entries().size(), 4u);
    EXPECT_EQ(buffer.entries().front().seq, 3u);
    EXPECT_EQ(buffer.entries().back().seq, 6u);
}

TEST_F(ConsoleBufferTest, ClearRewindsSequence) {
    ConsoleBuffer buffer(10, 2, 10);
    fill(buffer, 3);

    buffer.clear();

    EXPECT_TRUE(buffer.entries().empty());
    EXPECT_EQ(buffer.append("fresh").seq, 1u);
}

// =============================================================================
// Subscriptions
// =============================================================================

TEST_F(ConsoleBufferTest, NewSubscriberGetsFullSnapshot) {
    ConsoleBuffer buffer(10, 2, 10);
    fill(buffer, 3);

    auto sub = buffer.subscribe(0);

    ASSERT_EQ(sub.snapshot.size(), 3u);
    EXPECT_EQ(sub.snapshot[0].line, "line 1");
    EXPECT_FALSE(sub.reset);
    EXPECT_EQ(buffer.subscriberCount(), 1u);
}

TEST_F(ConsoleBufferTest, ResumingSubscriberGetsOnlyNewerEntries) {
    ConsoleBuffer buffer(10, 2, 10);
    fill(buffer, 5);

    auto sub = buffer.subscribe(3);

    ASSERT_EQ(sub.snapshot.size(), 2u);
    EXPECT_EQ(sub.snapshot[0].seq, 4u);
    EXPECT_EQ(sub.snapshot[1].seq, 5u);
    EXPECT_FALSE(sub.reset);
}

TEST_F(ConsoleBufferTest, UpToDateSubscriberGetsNothing) {
    ConsoleBuffer buffer(10, 2, 10);
    fill(buffer, 4);

    auto sub = buffer.subscribe(4);

    EXPECT_TRUE(sub.snapshot.empty());
    EXPECT_FALSE(sub.reset);
}

TEST_F(ConsoleBufferTest, TrimmedGapGivesFullSnapshot) {
    ConsoleBuffer buffer(5, 2, 10);
    fill(buffer, 8);
    ASSERT_EQ(buffer.entries().front().seq, 5u);

    auto sub = buffer.subscribe(2);

    EXPECT_EQ(sub.snapshot.size(), buffer.entries().size());
    EXPECT_FALSE(sub.reset);
}

TEST_F(ConsoleBufferTest, SubscriberAheadOfStreamIsReset) {
    ConsoleBuffer buffer(10, 2, 10);
    fill(buffer, 2);

    auto sub = buffer.subscribe(40);

    EXPECT_TRUE(sub.reset);
    EXPECT_EQ(sub.snapshot.size(), 2u);
}

TEST_F(ConsoleBufferTest, EmptyBufferResetsKnownViewer) {
    ConsoleBuffer buffer(10, 2, 10);

    EXPECT_TRUE(buffer.subscribe(7).reset);
    EXPECT_FALSE(buffer.subscribe(0).reset);
}

TEST_F(ConsoleBufferTest, BroadcastReachesLiveSubscribers) {
    ConsoleBuffer buffer(10, 2, 10);
    auto first = buffer.subscribe(0);
    auto second = buffer.subscribe(0);

    buffer.broadcast(buffer.append("[12:00:00 INFO]: Done (2.0s)!"));

    auto a = first.channel->pop(std::chrono::milliseconds(100));
    auto b = second.channel->pop(std::chrono::milliseconds(100));
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(a->seq, 1u);
    EXPECT_EQ(*a, *b);
}

TEST_F(ConsoleBufferTest, UnsubscribeClosesChannel) {
    ConsoleBuffer buffer(10, 2, 10);
    auto sub = buffer.subscribe(0);

    buffer.unsubscribe(sub.id);
    buffer.unsubscribe(sub.id);

    EXPECT_TRUE(sub.channel->isClosed());
    EXPECT_EQ(buffer.subscriberCount(), 0u);
    buffer.broadcast(buffer.append("after"));
    EXPECT_EQ(sub.channel->size(), 0u);
}

TEST_F(ConsoleBufferTest, DestructionClosesChannels) {
    std::shared_ptr<ConsoleChannel> channel;
    {
        ConsoleBuffer buffer(10, 2, 10);
        channel = buffer.subscribe(0).channel;
    }
    EXPECT_TRUE(channel->isClosed());
}

// =============================================================================
// ConsoleChannel
// =============================================================================

TEST(ConsoleChannelTest, FullChannelDropsInsteadOfBlocking) {
    ConsoleChannel channel(2);

    EXPECT_TRUE(channel.tryPush(core::ConsoleEntry{1, "a"}));
    EXPECT_TRUE(channel.tryPush(core::ConsoleEntry{2, "b"}));
    EXPECT_FALSE(channel.tryPush(core::ConsoleEntry{3, "c"}));

    EXPECT_EQ(channel.size(), 2u);
    EXPECT_EQ(channel.droppedCount(), 1u);
    EXPECT_EQ(channel.pop(std::chrono::milliseconds(0))->seq, 1u);
}

TEST(ConsoleChannelTest, PopTimesOutWhenEmpty) {
    ConsoleChannel channel(4);

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(channel.pop(std::chrono::milliseconds(30)).has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(25));
}

TEST(ConsoleChannelTest, CloseWakesWaitingReader) {
    ConsoleChannel channel(4);

    std::thread closer([&channel]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        channel.close();
    });
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(channel.pop(std::chrono::seconds(5)).has_value());
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(2));
    closer.join();

    EXPECT_FALSE(channel.tryPush(core::ConsoleEntry{1, "late"}));
}

TEST(ConsoleChannelTest, QueuedEntriesSurviveClose) {
    ConsoleChannel channel(4);
    ASSERT_TRUE(channel.tryPush(core::ConsoleEntry{9, "last words"}));

    channel.close();

    auto entry = channel.pop(std::chrono::milliseconds(0));
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->line, "last words");
}

} // namespace test
} // namespace console
} // namespace orexa
