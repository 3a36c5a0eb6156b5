/**
 * @file test_message_store.cpp
 * @brief Unit tests for MessageStore and PeerCursors
 *
 * Tests:
 * - Id assignment and uid deduplication
 * - read_since ordering, newest window and limit clamping
 * - read_since_time for gossip pulls
 * - Hive scoping
 * - Concurrent appends (uid races, gap-free ids)
 * - Peer cursor monotonicity
 */

#include <gtest/gtest.h>
#include "hivemind/errors.hpp"
#include "hivemind/memory_storage.hpp"
#include "hivemind/message_store.hpp"
#include "hivemind/peer_cursors.hpp"
#include "hivemind/utilities.hpp"
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace hivemind;

// Test fixture with an in-memory hive "hive-a"
class MessageStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        storage_ = std::make_unique<MemoryStorage>();
        store_ = std::make_unique<MessageStore>(*storage_, "hive-a");
    }

    void TearDown() override {
        store_.reset();
        storage_.reset();
    }

    static HiveMessage candidate(const std::string& uid, int64_t created_at_ms,
                                 const std::string& content = "hello") {
        HiveMessage message;
        message.uid = uid;
        message.created_at_ms = created_at_ms;
        message.ts = utilities::format_timestamp_ms(created_at_ms);
        message.agent_id = "agent-1";
        message.hive_id = "hive-a";
        message.content = content;
        return message;
    }

    std::unique_ptr<MemoryStorage> storage_;
    std::unique_ptr<MessageStore> store_;
};

// ============================================================================
// Append Tests
// ============================================================================

TEST_F(MessageStoreTest, AppendAssignsSequentialIds) {
    auto first = store_->append(candidate("u1", 1000));
    auto second = store_->append(candidate("u2", 900));

    ASSERT_TRUE(first && second);
    EXPECT_EQ(first->id, 1);
    EXPECT_EQ(second->id, 2);
    EXPECT_EQ(store_->count(), 2u);
}

TEST_F(MessageStoreTest, DuplicateUidIsIgnored) {
    ASSERT_TRUE(store_->append(candidate("u1", 1000, "first")).has_value());

    EXPECT_FALSE(store_->append(candidate("u1", 2000, "second")).has_value());
    EXPECT_EQ(store_->count(), 1u);
    EXPECT_EQ(store_->get(1)->content, "first");

    // The id counter is not consumed by a duplicate
    auto next = store_->append(candidate("u2", 3000));
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next->id, 2);
}

TEST_F(MessageStoreTest, AppendPreservesFields) {
    HiveMessage message = candidate("u1", 1762788645123, "content");
    message.channel = "ops";
    message.source = MessageSource::GOSSIP;

    store_->append(message);
    auto stored = store_->get(1);

    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->uid, "u1");
    EXPECT_EQ(stored->ts, "2025-11-10T15:30:45.123Z");
    EXPECT_EQ(stored->channel, "ops");
    EXPECT_TRUE(stored->source == MessageSource::GOSSIP);
    EXPECT_TRUE(store_->contains("u1"));
}

TEST_F(MessageStoreTest, AppendRejectsInvalidCandidates) {
    EXPECT_THROW(store_->append(candidate("", 1000)), ValidationError);

    HiveMessage foreign = candidate("u1", 1000);
    foreign.hive_id = "hive-b";
    EXPECT_THROW(store_->append(foreign), ValidationError);

    EXPECT_THROW(store_->append(candidate("u2", -1)), ValidationError);
    EXPECT_EQ(store_->count(), 0u);
}

// ============================================================================
// read_since Tests
// ============================================================================

TEST_F(MessageStoreTest, ReadSinceReturnsOldestFirst) {
    for (int i = 1; i <= 5; ++i) {
        store_->append(candidate("u" + std::to_string(i), 1000 + i));
    }

    auto messages = store_->read_since("hive-a", 2, 50);

    ASSERT_EQ(messages.size(), 3u);
    EXPECT_EQ(messages[0].id, 3);
    EXPECT_EQ(messages[2].id, 5);
}

TEST_F(MessageStoreTest, ReadSinceKeepsNewestWhenCapped) {
    for (int i = 1; i <= 3; ++i) {
        store_->append(candidate("u" + std::to_string(i), 1000 + i));
    }

    auto messages = store_->read_since("hive-a", 0, 2);

    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[0].id, 2);
    EXPECT_EQ(messages[1].id, 3);
}

TEST_F(MessageStoreTest, ReadSinceStopsAtCursor) {
    for (int i = 1; i <= 5; ++i) {
        store_->append(candidate("u" + std::to_string(i), 1000 + i));
    }

    auto messages = store_->read_since("hive-a", 3, 50);

    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[0].id, 4);
    EXPECT_EQ(messages[1].id, 5);
}

TEST_F(MessageStoreTest, ReadSinceClampsLimit) {
    for (int i = 1; i <= 205; ++i) {
        store_->append(candidate("u" + std::to_string(i), 1000 + i));
    }

    auto capped = store_->read_since("hive-a", 0, 1000);
    ASSERT_EQ(capped.size(), 200u);
    EXPECT_EQ(capped.front().id, 6);
    EXPECT_EQ(capped.back().id, 205);

    auto single = store_->read_since("hive-a", 0, 0);
    ASSERT_EQ(single.size(), 1u);
    EXPECT_EQ(single[0].id, 205);
}

TEST_F(MessageStoreTest, ReadSinceBeyondLatest) {
    store_->append(candidate("u1", 1000));

    EXPECT_TRUE(store_->read_since("hive-a", 1, 50).empty());
    EXPECT_TRUE(store_->read_since("hive-a", 999999, 50).empty());
}

TEST_F(MessageStoreTest, ReadOtherHiveIsEmpty) {
    store_->append(candidate("u1", 1000));

    EXPECT_TRUE(store_->read_since("hive-b", 0, 50).empty());
    EXPECT_TRUE(store_->read_since_time("hive-b", 0, 50).empty());
}

// ============================================================================
// read_since_time Tests
// ============================================================================

TEST_F(MessageStoreTest, ReadSinceTimeOrdersByCreation) {
    store_->append(candidate("late", 3000));
    store_->append(candidate("early", 1000));
    store_->append(candidate("middle", 2000));

    auto messages = store_->read_since_time("hive-a", 0, 500);

    ASSERT_EQ(messages.size(), 3u);
    EXPECT_EQ(messages[0].uid, "early");
    EXPECT_EQ(messages[1].uid, "middle");
    EXPECT_EQ(messages[2].uid, "late");
}

TEST_F(MessageStoreTest, ReadSinceTimeIsInclusive) {
    store_->append(candidate("a", 1000));
    store_->append(candidate("b", 2000));
    store_->append(candidate("c", 2000));
    store_->append(candidate("d", 3000));

    auto messages = store_->read_since_time("hive-a", 2000, 500);

    ASSERT_EQ(messages.size(), 3u);
    EXPECT_EQ(messages[0].uid, "b");
    EXPECT_EQ(messages[1].uid, "c");
    EXPECT_EQ(messages[2].uid, "d");
}

TEST_F(MessageStoreTest, ReadSinceTimeLimit) {
    for (int i = 1; i <= 10; ++i) {
        store_->append(candidate("u" + std::to_string(i), 1000 * i));
    }

    auto messages = store_->read_since_time("hive-a", 0, 4);

    ASSERT_EQ(messages.size(), 4u);
    EXPECT_EQ(messages.back().created_at_ms, 4000);
}

// ============================================================================
// Thread Safety Tests
// ============================================================================

TEST_F(MessageStoreTest, ConcurrentSameUidStoredOnce) {
    const int num_threads = 10;
    std::vector<std::thread> threads;
    std::vector<bool> results(num_threads);

    // All threads race to insert the same uid
    for (int t = 0; t < num_threads; t++) {
        threads.emplace_back([this, &results, t]() {
            results[t] = store_->append(candidate("shared", 1000 + t)).has_value();
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    int success_count = 0;
    for (bool result : results) {
        if (result) success_count++;
    }
    EXPECT_EQ(success_count, 1);
    EXPECT_EQ(store_->count(), 1u);
}

TEST_F(MessageStoreTest, ConcurrentAppendsHaveGaplessIds) {
    const int num_threads = 8;
    const int messages_per_thread = 25;
    std::vector<std::thread> threads;

    for (int t = 0; t < num_threads; t++) {
        threads.emplace_back([this, t, messages_per_thread]() {
            for (int i = 0; i < messages_per_thread; i++) {
                store_->append(candidate("t" + std::to_string(t) + "-" + std::to_string(i), 1000 + i));
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    const int total = num_threads * messages_per_thread;
    ASSERT_EQ(store_->count(), static_cast<size_t>(total));
    for (int id = 1; id <= total; id++) {
        EXPECT_TRUE(store_->get(id).has_value()) << "missing id " << id;
    }
    EXPECT_FALSE(store_->get(total + 1).has_value());
}

// ============================================================================
// Peer Cursor Tests
// ============================================================================

TEST(PeerCursorsTest, StartsAtZero) {
    MemoryStorage storage;
    PeerCursors cursors(storage);

    EXPECT_EQ(cursors.get("http://peer:8787"), 0);
}

TEST(PeerCursorsTest, OnlyMovesForward) {
    MemoryStorage storage;
    PeerCursors cursors(storage);
    const std::string peer = "http://peer:8787";

    EXPECT_TRUE(cursors.advance(peer, 5000));
    EXPECT_FALSE(cursors.advance(peer, 4000));
    EXPECT_FALSE(cursors.advance(peer, 5000));
    EXPECT_EQ(cursors.get(peer), 5000);

    EXPECT_TRUE(cursors.advance(peer, 6000));
    EXPECT_EQ(cursors.get(peer), 6000);
}

TEST(PeerCursorsTest, PeersAreIndependent) {
    MemoryStorage storage;
    PeerCursors cursors(storage);

    cursors.advance("http://a:1", 100);

    EXPECT_EQ(cursors.get("http://a:1"), 100);
    EXPECT_EQ(cursors.get("http://b:1"), 0);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
