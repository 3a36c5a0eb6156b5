/**
 * @file test_join_authenticator.cpp
 * @brief Unit tests for JoinAuthenticator and JoinRequest parsing
 *
 * Tests:
 * - Successful join and single-use nonces
 * - Binding, hive and expiry mismatches
 * - Expired challenges and clock skew
 * - Signature failures
 * - OpenClaw device proofs
 */

#include <gtest/gtest.h>
#include "hivemind/agent_keys.hpp"
#include "hivemind/errors.hpp"
#include "hivemind/hive_crypto.hpp"
#include "hivemind/join_authenticator.hpp"
#include "hivemind/memory_storage.hpp"
#include "hivemind/protocol.hpp"
#include <chrono>
#include <memory>
#include <string>

using namespace hivemind;
using namespace std::chrono_literals;

// Test fixture with an adjustable clock and one agent key pair
class JoinAuthenticatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(HiveCrypto::initialize());
        now_ = 1762788645000;
        storage_ = std::make_unique<MemoryStorage>();

        auto clock = [this]() { return now_; };
        challenges_ = std::make_unique<ChallengeManager>(*storage_, 120000ms, clock);
        sessions_ = std::make_unique<SessionStore>(*storage_, 86400000ms, clock);
        make_authenticator(false);

        keys_ = std::make_unique<AgentKeys>(AgentKeys::generate());
    }

    void TearDown() override {
        authenticator_.reset();
        sessions_.reset();
        challenges_.reset();
        storage_.reset();
    }

    void make_authenticator(bool device_proof_required) {
        JoinPolicy policy;
        policy.max_clock_skew = 120000ms;
        policy.device_proof_required = device_proof_required;
        policy.device_proof_ttl = 300000ms;
        authenticator_ = std::make_unique<JoinAuthenticator>(
            *challenges_, *sessions_, policy, [this]() { return now_; });
    }

    // Signed request for a freshly issued challenge
    JoinRequest signed_request(const Challenge& challenge) {
        JoinRequest request;
        request.agent_id = challenge.agent_id;
        request.pubkey = challenge.pubkey;
        request.nonce = challenge.nonce;
        request.timestamp = utilities::format_timestamp_ms(now_);
        request.hive_id = challenge.hive_id;
        request.expires_at = challenge.expires_at;

        protocol::JoinMessageFields fields;
        fields.agent_id = challenge.agent_id;
        fields.pubkey = challenge.pubkey;
        fields.nonce = challenge.nonce;
        fields.hive_id = challenge.hive_id;
        fields.challenge_expires_at = challenge.expires_at;
        fields.timestamp = request.timestamp;
        request.signature = keys_->sign_join(fields);

        return request;
    }

    Challenge issue() {
        return challenges_->issue("agent-1", keys_->public_key_b58(), "hive-a");
    }

    void attach_device_proof(JoinRequest& request) {
        auto device = HiveCrypto::generate_signature_keypair();
        request.device_public_key = HiveCrypto::bytes_to_base64(
            std::vector<uint8_t>(device.public_key.begin(), device.public_key.end()));
        request.device_nonce = "device-nonce-1";
        request.device_signature = HiveCrypto::sign_text_b64(request.device_nonce, device.secret_key);
        request.device_signed_at = utilities::format_timestamp_ms(now_);
    }

    std::string join_error(const JoinRequest& request) {
        try {
            authenticator_->join(request);
        } catch (const HiveError& e) {
            return e.what();
        }
        return "";
    }

    int64_t now_;
    std::unique_ptr<MemoryStorage> storage_;
    std::unique_ptr<ChallengeManager> challenges_;
    std::unique_ptr<SessionStore> sessions_;
    std::unique_ptr<JoinAuthenticator> authenticator_;
    std::unique_ptr<AgentKeys> keys_;
};

// ============================================================================
// Success Tests
// ============================================================================

TEST_F(JoinAuthenticatorTest, ValidJoinIssuesSession) {
    Challenge challenge = issue();

    IssuedSession issued = authenticator_->join(signed_request(challenge));

    EXPECT_EQ(issued.session.agent_id, "agent-1");
    EXPECT_EQ(issued.session.hive_id, "hive-a");
    EXPECT_EQ(issued.session.pubkey, keys_->public_key_b58());
    EXPECT_TRUE(sessions_->validate(issued.token).has_value());
}

TEST_F(JoinAuthenticatorTest, OptionalBindingFieldsMayBeOmitted) {
    Challenge challenge = issue();
    JoinRequest request = signed_request(challenge);
    request.hive_id.reset();
    request.expires_at.reset();

    EXPECT_NO_THROW(authenticator_->join(request));
}

TEST_F(JoinAuthenticatorTest, NonceIsSingleUse) {
    Challenge challenge = issue();
    JoinRequest request = signed_request(challenge);

    authenticator_->join(request);

    EXPECT_EQ(join_error(request), "challenge not found or expired");
}

// ============================================================================
// Rejection Tests
// ============================================================================

TEST_F(JoinAuthenticatorTest, UnknownNonce) {
    Challenge challenge = issue();
    JoinRequest request = signed_request(challenge);
    request.nonce = "00000000-0000-4000-8000-000000000000";

    EXPECT_THROW(authenticator_->join(request), AuthenticationError);
    EXPECT_EQ(join_error(request), "challenge not found or expired");
}

TEST_F(JoinAuthenticatorTest, AgentMismatch) {
    Challenge challenge = issue();
    JoinRequest request = signed_request(challenge);
    request.agent_id = "agent-2";

    EXPECT_EQ(join_error(request), "challenge does not match agent_id or pubkey");
    // A failed binding check leaves the challenge usable
    EXPECT_TRUE(challenges_->find(challenge.nonce).has_value());
}

TEST_F(JoinAuthenticatorTest, PubkeyMismatch) {
    Challenge challenge = issue();
    JoinRequest request = signed_request(challenge);
    auto other = AgentKeys::generate();
    request.pubkey = other.public_key_b58();

    EXPECT_EQ(join_error(request), "challenge does not match agent_id or pubkey");
}

TEST_F(JoinAuthenticatorTest, HiveMismatch) {
    Challenge challenge = issue();
    JoinRequest request = signed_request(challenge);
    request.hive_id = "hive-b";

    EXPECT_EQ(join_error(request), "hive_id mismatch");
}

TEST_F(JoinAuthenticatorTest, ExpiresAtMismatch) {
    Challenge challenge = issue();
    JoinRequest request = signed_request(challenge);
    request.expires_at = utilities::format_timestamp_ms(now_);

    EXPECT_EQ(join_error(request), "expires_at mismatch");
}

TEST_F(JoinAuthenticatorTest, ExpiredChallengeIsDeleted) {
    Challenge challenge = issue();
    now_ += 120001;
    JoinRequest request = signed_request(challenge);

    EXPECT_EQ(join_error(request), "challenge expired");
    EXPECT_FALSE(challenges_->find(challenge.nonce).has_value());
}

TEST_F(JoinAuthenticatorTest, UnparseableTimestamp) {
    Challenge challenge = issue();
    JoinRequest request = signed_request(challenge);
    request.timestamp = "yesterday";

    EXPECT_THROW(authenticator_->join(request), ValidationError);
}

TEST_F(JoinAuthenticatorTest, ClockSkewExceeded) {
    Challenge challenge = issue();

    // Sign with a timestamp just outside the allowed skew
    now_ -= 120001;
    JoinRequest request = signed_request(challenge);
    now_ += 120001;

    EXPECT_EQ(join_error(request), "timestamp outside allowed clock skew");
    EXPECT_TRUE(challenges_->find(challenge.nonce).has_value());
}

TEST_F(JoinAuthenticatorTest, ClockSkewAtBoundary) {
    Challenge challenge = issue();

    now_ += 120000;
    JoinRequest request = signed_request(challenge);
    now_ -= 120000;

    EXPECT_NO_THROW(authenticator_->join(request));
}

TEST_F(JoinAuthenticatorTest, TamperedSignature) {
    Challenge challenge = issue();
    JoinRequest request = signed_request(challenge);
    request.signature = keys_->sign("something else");

    EXPECT_EQ(join_error(request), "invalid signature");
    EXPECT_TRUE(challenges_->find(challenge.nonce).has_value());
}

TEST_F(JoinAuthenticatorTest, GarbageSignature) {
    Challenge challenge = issue();
    JoinRequest request = signed_request(challenge);
    request.signature = "%%%not-base64%%%";

    EXPECT_EQ(join_error(request), "invalid signature");
}

TEST_F(JoinAuthenticatorTest, WrongKeySignature) {
    Challenge challenge = issue();
    JoinRequest request = signed_request(challenge);
    auto other = AgentKeys::generate();

    protocol::JoinMessageFields fields;
    fields.agent_id = challenge.agent_id;
    fields.pubkey = challenge.pubkey;
    fields.nonce = challenge.nonce;
    fields.hive_id = challenge.hive_id;
    fields.challenge_expires_at = challenge.expires_at;
    fields.timestamp = request.timestamp;
    request.signature = other.sign_join(fields);

    EXPECT_EQ(join_error(request), "invalid signature");
}

// ============================================================================
// Device Proof Tests
// ============================================================================

TEST_F(JoinAuthenticatorTest, RequiredDeviceProofMissing) {
    make_authenticator(true);
    Challenge challenge = issue();

    EXPECT_EQ(join_error(signed_request(challenge)), "missing OpenClaw device proof fields");
}

TEST_F(JoinAuthenticatorTest, RequiredDeviceProofValid) {
    make_authenticator(true);
    Challenge challenge = issue();
    JoinRequest request = signed_request(challenge);
    attach_device_proof(request);

    EXPECT_NO_THROW(authenticator_->join(request));
}

TEST_F(JoinAuthenticatorTest, PartialDeviceProofRejected) {
    Challenge challenge = issue();
    JoinRequest request = signed_request(challenge);
    attach_device_proof(request);
    request.device_signed_at.clear();

    EXPECT_EQ(join_error(request), "missing OpenClaw device proof fields");
}

TEST_F(JoinAuthenticatorTest, OptionalDeviceProofStillVerified) {
    Challenge challenge = issue();
    JoinRequest request = signed_request(challenge);
    attach_device_proof(request);
    request.device_nonce = "different-nonce";

    EXPECT_EQ(join_error(request), "invalid OpenClaw device proof");
}

TEST_F(JoinAuthenticatorTest, StaleDeviceProof) {
    make_authenticator(true);
    Challenge challenge = issue();
    JoinRequest request = signed_request(challenge);
    attach_device_proof(request);
    request.device_signed_at = utilities::format_timestamp_ms(now_ - 300001);

    EXPECT_FALSE(authenticator_->verify_device_proof(request));
    EXPECT_EQ(join_error(request), "invalid OpenClaw device proof");
}

// ============================================================================
// Request Parsing Tests
// ============================================================================

TEST(JoinRequestTest, FromJsonRequiresFields) {
    nlohmann::json body = {
        {"agent_id", "agent-1"},
        {"pubkey", "key"},
        {"nonce", "n"},
        {"signature", "sig"},
        {"timestamp", "2025-11-10T15:30:45.123Z"}
    };

    auto parsed = JoinRequest::from_json(body);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_FALSE(parsed->hive_id.has_value());
    EXPECT_FALSE(parsed->has_any_device_field());

    body.erase("signature");
    EXPECT_FALSE(JoinRequest::from_json(body).has_value());

    body["signature"] = 42;
    EXPECT_FALSE(JoinRequest::from_json(body).has_value());

    EXPECT_FALSE(JoinRequest::from_json(nlohmann::json::array()).has_value());
}

TEST(JoinRequestTest, ToJsonKeepsPartialDeviceFields) {
    JoinRequest request;
    request.agent_id = "agent-1";
    request.pubkey = "key";
    request.nonce = "n";
    request.signature = "sig";
    request.timestamp = "2025-11-10T15:30:45.123Z";
    request.device_nonce = "dn";

    auto parsed = JoinRequest::from_json(request.to_json());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_TRUE(parsed->has_any_device_field());
    EXPECT_FALSE(parsed->has_all_device_fields());
    EXPECT_EQ(parsed->device_nonce, "dn");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
