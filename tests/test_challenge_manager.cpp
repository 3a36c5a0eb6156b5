/**
 * @file test_challenge_manager.cpp
 * @brief Unit tests for ChallengeManager
 *
 * Tests challenge lifecycle including:
 * - Issue validation
 * - Nonce uniqueness and expiry timestamps
 * - Lookup and single-use consumption
 * - Expiry and eviction with a controlled clock
 */

#include <gtest/gtest.h>
#include "hivemind/challenge_manager.hpp"
#include "hivemind/errors.hpp"
#include "hivemind/hive_crypto.hpp"
#include "hivemind/memory_storage.hpp"
#include <chrono>
#include <memory>
#include <set>

using namespace hivemind;
using namespace std::chrono_literals;

// Test fixture with an adjustable clock
class ChallengeManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(HiveCrypto::initialize());
        now_ = 1762788645000;
        storage_ = std::make_unique<MemoryStorage>();
        manager_ = std::make_unique<ChallengeManager>(*storage_, 120000ms, [this]() { return now_; });

        auto keypair = HiveCrypto::generate_signature_keypair();
        pubkey_ = HiveCrypto::bytes_to_base58(
            std::vector<uint8_t>(keypair.public_key.begin(), keypair.public_key.end()));
    }

    void TearDown() override {
        manager_.reset();
        storage_.reset();
    }

    int64_t now_;
    std::string pubkey_;
    std::unique_ptr<MemoryStorage> storage_;
    std::unique_ptr<ChallengeManager> manager_;
};

// ============================================================================
// Issue Tests
// ============================================================================

TEST_F(ChallengeManagerTest, IssueReturnsBoundChallenge) {
    Challenge challenge = manager_->issue("agent-1", pubkey_, "hive-a");

    EXPECT_EQ(challenge.agent_id, "agent-1");
    EXPECT_EQ(challenge.pubkey, pubkey_);
    EXPECT_EQ(challenge.hive_id, "hive-a");
    EXPECT_EQ(challenge.nonce.size(), 36u);
    EXPECT_EQ(challenge.expires_at, utilities::format_timestamp_ms(now_ + 120000));
}

TEST_F(ChallengeManagerTest, IssueStoresChallenge) {
    Challenge challenge = manager_->issue("agent-1", pubkey_, "hive-a");

    auto found = manager_->find(challenge.nonce);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->agent_id, "agent-1");
    EXPECT_EQ(found->expires_at, challenge.expires_at);
    EXPECT_TRUE(storage_->get("challenge:" + challenge.nonce).has_value());
}

TEST_F(ChallengeManagerTest, NoncesAreUnique) {
    std::set<std::string> nonces;
    for (int i = 0; i < 50; ++i) {
        nonces.insert(manager_->issue("agent-1", pubkey_, "hive-a").nonce);
    }

    EXPECT_EQ(nonces.size(), 50u);
    EXPECT_EQ(manager_->pending_count(), 50u);
}

TEST_F(ChallengeManagerTest, IssueRequiresFields) {
    EXPECT_THROW(manager_->issue("", pubkey_, "hive-a"), ValidationError);
    EXPECT_THROW(manager_->issue("agent-1", "", "hive-a"), ValidationError);
}

TEST_F(ChallengeManagerTest, IssueRejectsInvalidPubkey) {
    try {
        manager_->issue("agent-1", "not-a-key", "hive-a");
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.status(), 400);
    }
    EXPECT_EQ(manager_->pending_count(), 0u);
}

TEST_F(ChallengeManagerTest, IssueRejectsInvalidAgentId) {
    EXPECT_THROW(manager_->issue("agent 1", pubkey_, "hive-a"), ValidationError);
}

// ============================================================================
// Consume Tests
// ============================================================================

TEST_F(ChallengeManagerTest, ConsumeIsSingleUse) {
    Challenge challenge = manager_->issue("agent-1", pubkey_, "hive-a");

    EXPECT_TRUE(manager_->consume(challenge.nonce));
    EXPECT_FALSE(manager_->consume(challenge.nonce));
    EXPECT_FALSE(manager_->find(challenge.nonce).has_value());
}

TEST_F(ChallengeManagerTest, FindUnknownNonce) {
    EXPECT_FALSE(manager_->find("00000000-0000-4000-8000-000000000000").has_value());
    EXPECT_FALSE(manager_->find("").has_value());
}

TEST_F(ChallengeManagerTest, FindDropsUnreadableRecord) {
    storage_->put("challenge:broken", "{not json");

    EXPECT_FALSE(manager_->find("broken").has_value());
    EXPECT_FALSE(storage_->get("challenge:broken").has_value());
}

// ============================================================================
// Expiry Tests
// ============================================================================

TEST_F(ChallengeManagerTest, ExpiryBoundary) {
    Challenge challenge = manager_->issue("agent-1", pubkey_, "hive-a");

    now_ += 120000;
    EXPECT_FALSE(manager_->is_expired(challenge));

    now_ += 1;
    EXPECT_TRUE(manager_->is_expired(challenge));
}

TEST_F(ChallengeManagerTest, UnparseableExpiryCountsAsExpired) {
    Challenge challenge = manager_->issue("agent-1", pubkey_, "hive-a");
    challenge.expires_at = "whenever";

    EXPECT_TRUE(manager_->is_expired(challenge));
}

TEST_F(ChallengeManagerTest, EvictExpired) {
    manager_->issue("agent-1", pubkey_, "hive-a");
    manager_->issue("agent-2", pubkey_, "hive-a");

    now_ += 60000;
    Challenge fresh = manager_->issue("agent-3", pubkey_, "hive-a");

    now_ += 61000;
    EXPECT_EQ(manager_->evict_expired(), 2u);
    EXPECT_EQ(manager_->pending_count(), 1u);
    EXPECT_TRUE(manager_->find(fresh.nonce).has_value());
}

TEST_F(ChallengeManagerTest, IssueEvictsExpiredChallenges) {
    manager_->issue("agent-1", pubkey_, "hive-a");

    now_ += 200000;
    manager_->issue("agent-2", pubkey_, "hive-a");

    EXPECT_EQ(manager_->pending_count(), 1u);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
