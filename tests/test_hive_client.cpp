/**
 * @file test_hive_client.cpp
 * @brief Loopback tests for HiveClient against a running HiveNode
 *
 * Tests:
 * - Health over HTTP
 * - Challenge, join, post and read through the client
 * - Error statuses surfaced as HiveClientError
 * - Shutdown while the maintenance loop runs
 * - Gossip between two nodes over HTTP
 */

#include <gtest/gtest.h>
#include "hivemind/agent_keys.hpp"
#include "hivemind/hive_client.hpp"
#include "hivemind/hive_node.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <thread>

using namespace hivemind;

namespace {

HiveConfig loopback_config() {
    HiveConfig cfg;
    cfg.host = "127.0.0.1";
    cfg.port = 0;
    cfg.worker_threads = 2;
    cfg.log_level = "warn";
    return cfg;
}

std::string url_of(const HiveNode& node) {
    return "http://127.0.0.1:" + std::to_string(node.port());
}

} // namespace

// Test fixture with one node on an ephemeral port
class HiveClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        node_ = std::make_unique<HiveNode>(loopback_config());
        ASSERT_TRUE(node_->start());
        ASSERT_NE(node_->port(), 0);
    }

    void TearDown() override {
        if (node_) {
            node_->stop();
        }
    }

    std::unique_ptr<HiveNode> node_;
};

// ============================================================================
// Client Flow Tests
// ============================================================================

TEST_F(HiveClientTest, Health) {
    HiveClient client(url_of(*node_));

    auto health = client.health();

    EXPECT_EQ(health["status"], "ok");
    EXPECT_EQ(health["hive_id"], "openclaw-devnet");
}

TEST_F(HiveClientTest, JoinPostRead) {
    HiveClient client(url_of(*node_));
    AgentKeys keys = AgentKeys::generate();

    ChallengeResponse challenge = client.request_challenge("agent-1", keys.public_key_b58());
    EXPECT_EQ(challenge.protocol_version, "OPENCLAW_HIVEMIND_V1");
    EXPECT_EQ(challenge.hive_id, "openclaw-devnet");

    JoinResponse joined = client.join("agent-1", keys, challenge);
    EXPECT_EQ(joined.agent_id, "agent-1");
    EXPECT_EQ(client.session_token(), joined.session_token);

    HiveMessage posted = client.post_message("hello over http", "ops");
    EXPECT_EQ(posted.id, 1);
    EXPECT_EQ(posted.channel, "ops");

    auto messages = client.read_messages();
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0].content, "hello over http");
    EXPECT_EQ(messages[0].agent_id, "agent-1");
}

TEST_F(HiveClientTest, ChallengeForOtherHive) {
    HiveClient client(url_of(*node_));
    AgentKeys keys = AgentKeys::generate();

    ChallengeResponse challenge = client.request_challenge("agent-1", keys.public_key_b58(), "team-b");
    JoinResponse joined = client.join("agent-1", keys, challenge);

    EXPECT_EQ(joined.hive_id, "team-b");
    EXPECT_EQ(client.read_messages_json()["hive_id"], "team-b");
}

TEST_F(HiveClientTest, ReplayedChallengeRejected) {
    HiveClient client(url_of(*node_));
    AgentKeys keys = AgentKeys::generate();

    ChallengeResponse challenge = client.request_challenge("agent-1", keys.public_key_b58());
    client.join("agent-1", keys, challenge);

    try {
        client.join("agent-1", keys, challenge);
        FAIL() << "expected HiveClientError";
    } catch (const HiveClientError& e) {
        EXPECT_EQ(e.status(), 401);
        EXPECT_NE(std::string(e.what()).find("challenge not found or expired"), std::string::npos);
    }
}

TEST_F(HiveClientTest, PartialDeviceProofRejected) {
    HiveClient client(url_of(*node_));
    AgentKeys keys = AgentKeys::generate();
    ChallengeResponse challenge = client.request_challenge("agent-1", keys.public_key_b58());

    DeviceProof proof;
    proof.nonce = "device-nonce";

    try {
        client.join("agent-1", keys, challenge, proof);
        FAIL() << "expected HiveClientError";
    } catch (const HiveClientError& e) {
        EXPECT_EQ(e.status(), 401);
        EXPECT_NE(std::string(e.what()).find("missing OpenClaw device proof fields"), std::string::npos);
    }
}

TEST_F(HiveClientTest, PostWithoutSession) {
    HiveClient client(url_of(*node_));
    client.set_session_token("openclaw-devnet.forged");

    try {
        client.post_message("hello");
        FAIL() << "expected HiveClientError";
    } catch (const HiveClientError& e) {
        EXPECT_EQ(e.status(), 401);
    }
}

TEST_F(HiveClientTest, RunReturnsAfterStop) {
    std::thread maintenance([this]() { node_->run(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    node_->stop();
    maintenance.join();

    EXPECT_FALSE(node_->is_running());
    node_.reset();
}

TEST(HiveClientTransportTest, UnreachableServer) {
    // Port 1 on loopback is not served
    HiveClient client("http://127.0.0.1:1", std::chrono::milliseconds(500));

    try {
        client.health();
        FAIL() << "expected HiveClientError";
    } catch (const HiveClientError& e) {
        EXPECT_EQ(e.status(), 0);
    }
}

// ============================================================================
// Gossip Tests
// ============================================================================

TEST(HiveGossipLoopbackTest, MessagesReachPeer) {
    HiveConfig source_config = loopback_config();
    source_config.gossip_secret = "shared";
    HiveNode source(source_config);
    ASSERT_TRUE(source.start());

    HiveConfig follower_config = loopback_config();
    follower_config.gossip_secret = "shared";
    follower_config.peers = {url_of(source)};
    follower_config.gossip_interval = std::chrono::milliseconds(1000);
    HiveNode follower(follower_config);
    ASSERT_TRUE(follower.start());
    ASSERT_NE(follower.gossip(), nullptr);

    HiveClient author(url_of(source));
    AgentKeys keys = AgentKeys::generate();
    author.join("agent-1", keys, author.request_challenge("agent-1", keys.public_key_b58()));
    author.post_message("gossiped");

    // The follower's agents see the message once gossip catches up
    HiveClient reader(url_of(follower));
    AgentKeys reader_keys = AgentKeys::generate();
    reader.join("agent-2", reader_keys, reader.request_challenge("agent-2", reader_keys.public_key_b58()));

    std::vector<HiveMessage> seen;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (seen.empty() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        seen = reader.read_messages();
    }

    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].content, "gossiped");
    EXPECT_EQ(seen[0].agent_id, "agent-1");
    EXPECT_TRUE(seen[0].source == MessageSource::GOSSIP);

    follower.stop();
    source.stop();
}

TEST(HiveGossipLoopbackTest, WrongSecretCountsAsFailure) {
    HiveConfig source_config = loopback_config();
    source_config.gossip_secret = "right";
    HiveNode source(source_config);
    ASSERT_TRUE(source.start());

    HiveConfig follower_config = loopback_config();
    follower_config.gossip_secret = "wrong";
    follower_config.peers = {url_of(source)};
    HiveNode follower(follower_config);
    ASSERT_TRUE(follower.start());

    GossipCycleReport report = follower.gossip()->run_cycle();

    EXPECT_EQ(report.peers_failed, 1u);
    EXPECT_EQ(report.accepted, 0u);

    follower.stop();
    source.stop();
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
