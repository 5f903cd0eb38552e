/**
 * @file loopback_ping_example.cpp
 * @brief Runs a gateway and a proxy against an in-process relay and exchanges one ping
 */

#include "contextvm/crypto/sodium_interop.hpp"
#include "contextvm/gateway/gateway.hpp"
#include "contextvm/identity/signer_keys.hpp"
#include "contextvm/proxy/proxy.hpp"
#include "contextvm/relay/local_relay.hpp"
#include "contextvm/relay/local_relay_client.hpp"

#include <chrono>
#include <iostream>
#include <thread>

using namespace contextvm;

namespace {
    constexpr std::string_view RELAY_URL = "ws://relay.loopback";

    class PongHandler : public interfaces::IMessageHandler {
    public:
        std::optional<protocol::McpMessage> OnMessage(const interfaces::IncomingMessage& incoming) override {
            std::cout << "   <- " << incoming.sender_pubkey.substr(0, 12) << "... "
                      << (incoming.is_encrypted ? "(gift-wrapped)" : "(plain)") << std::endl;
            auto pong = protocol::McpMessage::FromJson(R"({"op":"pong"})");
            if (pong.IsErr()) {
                return std::nullopt;
            }
            return std::move(pong).Unwrap();
        }
    };

    Result<std::shared_ptr<relay::LocalRelayClient>, TransportFailure> Join(
        const std::shared_ptr<relay::LocalRelay>& relay) {
        auto keys = identity::SignerKeys::Generate();
        if (keys.IsErr()) {
            return Result<std::shared_ptr<relay::LocalRelayClient>, TransportFailure>::Err(keys.UnwrapErr());
        }
        return relay::LocalRelayClient::Create(std::move(keys).Unwrap(), {relay});
    }
}

int main() {
    std::cout << "=== ContextVM - Loopback Ping Example ===" << std::endl;

    if (auto init = crypto::SodiumInterop::Initialize(); init.IsErr()) {
        std::cerr << "Failed to initialize libsodium: " << init.UnwrapErr().message << std::endl;
        return 1;
    }

    auto relay = std::make_shared<relay::LocalRelay>(std::string(RELAY_URL));
    auto server_relay = Join(relay);
    auto client_relay = Join(relay);
    if (server_relay.IsErr() || client_relay.IsErr()) {
        std::cerr << "Failed to create relay identities" << std::endl;
        return 1;
    }
    const auto server_pubkey = server_relay.Unwrap()->PublicKey().Unwrap();

    auto server_config = configuration::ServerTransportConfig::Default();
    server_config.relay_urls = {std::string(RELAY_URL)};
    server_config.server_info = configuration::ServerInfo{.name = "loopback-example", .version = "0.1.0"};
    auto gateway_result = gateway::Gateway::Create(server_relay.Unwrap(), server_config);
    if (gateway_result.IsErr()) {
        std::cerr << "Failed to create gateway: " << gateway_result.UnwrapErr().message << std::endl;
        return 1;
    }
    auto gateway = std::move(gateway_result).Unwrap();
    gateway->Transport().SetMessageHandler(std::make_shared<PongHandler>());

    std::thread server_thread([&gateway]() {
        if (auto started = gateway->Start(); started.IsErr()) {
            std::cerr << "Gateway stopped: " << started.UnwrapErr().message << std::endl;
        }
    });
    while (!gateway->Transport().IsRunning()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    std::cout << "1. Gateway listening as " << server_pubkey << std::endl;

    auto client_config = configuration::ClientTransportConfig::Default();
    client_config.relay_urls = {std::string(RELAY_URL)};
    auto proxy_result = proxy::Proxy::Create(client_relay.Unwrap(), client_config);
    if (proxy_result.IsErr()) {
        std::cerr << "Failed to create proxy: " << proxy_result.UnwrapErr().message << std::endl;
        gateway->Stop();
        server_thread.join();
        return 1;
    }
    auto proxy = std::move(proxy_result).Unwrap();

    int exit_code = 0;
    if (auto connected = proxy->Connect(); connected.IsErr()) {
        std::cerr << "Failed to connect proxy: " << connected.UnwrapErr().message << std::endl;
        exit_code = 1;
    } else {
        auto ping = protocol::McpMessage::FromJson(R"({"op":"ping"})").Unwrap();
        for (const bool encrypt : {false, true}) {
            std::cout << "2. Sending ping " << (encrypt ? "gift-wrapped" : "in plaintext") << std::endl;
            auto reply = proxy->Request(server_pubkey, ping, encrypt);
            if (reply.IsErr()) {
                std::cerr << "   Request failed: [" << FailureTypeToString(reply.UnwrapErr().type) << "] "
                          << reply.UnwrapErr().message << std::endl;
                exit_code = 1;
                continue;
            }
            std::cout << "   -> " << reply.Unwrap().ToJson().Unwrap() << std::endl;
        }
        proxy->Disconnect();
    }

    gateway->Stop();
    server_thread.join();
    std::cout << "3. Sessions tracked: " << gateway->Transport().SessionCount() << std::endl;
    return exit_code;
}
