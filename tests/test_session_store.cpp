/**
 * @file test_session_store.cpp
 * @brief Unit tests for SessionStore and session token helpers
 *
 * Tests:
 * - Token format and hive routing prefix
 * - Validation before and after expiry
 * - Lazy and swept eviction, revocation
 * - Bearer header parsing
 */

#include <gtest/gtest.h>
#include "hivemind/hive_crypto.hpp"
#include "hivemind/memory_storage.hpp"
#include "hivemind/protocol.hpp"
#include "hivemind/session_store.hpp"
#include <chrono>
#include <memory>

using namespace hivemind;
using namespace std::chrono_literals;

// Test fixture with an adjustable clock
class SessionStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(HiveCrypto::initialize());
        now_ = 1762788645000;
        storage_ = std::make_unique<MemoryStorage>();
        sessions_ = std::make_unique<SessionStore>(*storage_, 86400000ms, [this]() { return now_; });
    }

    void TearDown() override {
        sessions_.reset();
        storage_.reset();
    }

    int64_t now_;
    std::unique_ptr<MemoryStorage> storage_;
    std::unique_ptr<SessionStore> sessions_;
};

// ============================================================================
// Session Tests
// ============================================================================

TEST_F(SessionStoreTest, CreateBindsAgentAndHive) {
    IssuedSession issued = sessions_->create("agent-1", "pubkey", "hive-a");

    EXPECT_EQ(issued.session.agent_id, "agent-1");
    EXPECT_EQ(issued.session.hive_id, "hive-a");
    EXPECT_EQ(issued.session.expires_at_ms, now_ + 86400000);
}

TEST_F(SessionStoreTest, TokenCarriesHivePrefix) {
    IssuedSession issued = sessions_->create("agent-1", "pubkey", "hive-a");

    auto hive = protocol::hive_from_token(issued.token);
    ASSERT_TRUE(hive.has_value());
    EXPECT_EQ(*hive, "hive-a");
}

TEST_F(SessionStoreTest, TokensAreUnique) {
    auto first = sessions_->create("agent-1", "pubkey", "hive-a");
    auto second = sessions_->create("agent-1", "pubkey", "hive-a");

    EXPECT_NE(first.token, second.token);
}

TEST_F(SessionStoreTest, ValidateActiveSession) {
    IssuedSession issued = sessions_->create("agent-1", "pubkey", "hive-a");

    now_ += 86400000;
    auto session = sessions_->validate(issued.token);

    ASSERT_TRUE(session.has_value());
    EXPECT_EQ(session->agent_id, "agent-1");
}

TEST_F(SessionStoreTest, ExpiredSessionIsEvicted) {
    IssuedSession issued = sessions_->create("agent-1", "pubkey", "hive-a");

    now_ += 86400001;
    EXPECT_FALSE(sessions_->validate(issued.token).has_value());
    EXPECT_FALSE(storage_->get("session:" + issued.token).has_value());

    // Still rejected after the clock would otherwise allow it
    now_ -= 86400001;
    EXPECT_FALSE(sessions_->validate(issued.token).has_value());
}

TEST_F(SessionStoreTest, EvictExpiredSweepsUnreadSessions) {
    IssuedSession old_session = sessions_->create("agent-1", "pubkey", "hive-a");
    now_ += 1000;
    IssuedSession fresh = sessions_->create("agent-2", "pubkey", "hive-a");
    storage_->put("session:hive-a.garbage", "not json");

    now_ += 86400000;
    EXPECT_EQ(sessions_->evict_expired(), 2u);

    EXPECT_FALSE(storage_->get("session:" + old_session.token).has_value());
    EXPECT_FALSE(storage_->get("session:hive-a.garbage").has_value());
    EXPECT_TRUE(sessions_->validate(fresh.token).has_value());
    EXPECT_EQ(sessions_->evict_expired(), 0u);
}

TEST_F(SessionStoreTest, UnknownTokenRejected) {
    EXPECT_FALSE(sessions_->validate("hive-a.unknown").has_value());
    EXPECT_FALSE(sessions_->validate("").has_value());
}

TEST_F(SessionStoreTest, Revoke) {
    IssuedSession issued = sessions_->create("agent-1", "pubkey", "hive-a");

    EXPECT_TRUE(sessions_->revoke(issued.token));
    EXPECT_FALSE(sessions_->validate(issued.token).has_value());
    EXPECT_FALSE(sessions_->revoke(issued.token));
}

// ============================================================================
// Token Helper Tests
// ============================================================================

TEST(SessionTokenTest, HiveFromTokenUsesLastDot) {
    EXPECT_EQ(protocol::hive_from_token("team.alpha.1234"), std::optional<std::string>("team.alpha"));
    EXPECT_FALSE(protocol::hive_from_token("nodot").has_value());
    EXPECT_FALSE(protocol::hive_from_token(".1234").has_value());
    EXPECT_FALSE(protocol::hive_from_token("hive.").has_value());
}

TEST(SessionTokenTest, ParseBearerToken) {
    EXPECT_EQ(protocol::parse_bearer_token("Bearer abc.def"), std::optional<std::string>("abc.def"));
    EXPECT_FALSE(protocol::parse_bearer_token("").has_value());
    EXPECT_FALSE(protocol::parse_bearer_token("Basic abc").has_value());
    EXPECT_FALSE(protocol::parse_bearer_token("Bearer ").has_value());
}

TEST(SessionTokenTest, MakeSessionToken) {
    EXPECT_EQ(protocol::make_session_token("hive-a", "id"), "hive-a.id");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
