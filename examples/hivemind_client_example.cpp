/**
 * @file hivemind_client_example.cpp
 * @brief Example agent: join a hive, post a message, print the inbox
 *
 * Hivemind - Agent Coordination Bus
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Environment:
 * - HIVEMIND_URL        Server base URL (default http://localhost:8787)
 * - AGENT_ID            Agent identifier (default agent-001)
 * - HIVE_ID             Hive to join (server default when unset)
 * - AGENT_KEYPAIR_PATH  Key file, generated when missing (default ./keys/agent.json)
 * - OPENCLAW_DEVICE_PUBLIC_KEY, OPENCLAW_DEVICE_SIGNATURE,
 *   OPENCLAW_DEVICE_NONCE, OPENCLAW_DEVICE_SIGNED_AT  Optional device proof
 *
 * Command line arguments are joined into the message text.
 */

#include "hivemind/agent_keys.hpp"
#include "hivemind/hive_client.hpp"
#include "hivemind/hive_crypto.hpp"
#include "hivemind/utilities.hpp"

#include <iostream>
#include <optional>
#include <string>

using namespace hivemind;
using namespace hivemind::utilities;

// Device proof from the environment, when any field is set
std::optional<DeviceProof> device_proof_from_environment() {
    DeviceProof proof;
    proof.public_key = get_env("OPENCLAW_DEVICE_PUBLIC_KEY");
    proof.signature = get_env("OPENCLAW_DEVICE_SIGNATURE");
    proof.nonce = get_env("OPENCLAW_DEVICE_NONCE");
    proof.signed_at = get_env("OPENCLAW_DEVICE_SIGNED_AT");

    if (proof.public_key.empty() && proof.signature.empty() &&
        proof.nonce.empty() && proof.signed_at.empty()) {
        return std::nullopt;
    }
    return proof;
}

int main(int argc, char* argv[]) {
    initialize_logging("", LogLevel::WARN);

    if (!HiveCrypto::initialize()) {
        std::cerr << "Failed to initialize libsodium\n";
        return 1;
    }

    std::string base_url = get_env("HIVEMIND_URL", "http://localhost:8787");
    std::string agent_id = get_env("AGENT_ID", "agent-001");
    std::string hive_id = get_env("HIVE_ID");
    std::string key_path = get_env("AGENT_KEYPAIR_PATH", "./keys/agent.json");

    std::string text;
    for (int i = 1; i < argc; ++i) {
        if (!text.empty()) {
            text += " ";
        }
        text += argv[i];
    }
    if (text.empty()) {
        text = "Hello from OpenClaw agent";
    }

    try {
        AgentKeys keys = AgentKeys::load_or_generate(key_path);
        std::cout << "Agent " << agent_id << " public key: " << keys.public_key_b58() << "\n";

        HiveClient client(base_url);

        ChallengeResponse challenge = client.request_challenge(agent_id, keys.public_key_b58(), hive_id);
        std::cout << "Challenge " << challenge.nonce << " for hive " << challenge.hive_id
                  << " expires at " << challenge.expires_at << "\n";

        JoinResponse joined = client.join(agent_id, keys, challenge, device_proof_from_environment());
        std::cout << "Joined hive " << joined.hive_id << ", session expires at " << joined.expires_at << "\n";

        HiveMessage posted = client.post_message(text);
        std::cout << "Posted message " << posted.id << " (" << posted.uid << ")\n";

        std::cout << client.read_messages_json(0, 50).dump(2) << "\n";

    } catch (const HiveClientError& e) {
        std::cerr << "Hivemind error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
