#pragma once
#include "contextvm/core/result.hpp"
#include "contextvm/core/failures.hpp"
#include "contextvm/configuration/transport_config.hpp"
#include "contextvm/interfaces/i_message_handler.hpp"
#include "contextvm/interfaces/i_relay_client.hpp"
#include "contextvm/protocol/mcp_message.hpp"
#include "contextvm/protocol/session_table.hpp"
#include <google/protobuf/struct.pb.h>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
namespace contextvm::transport {

/**
 * @brief Serving side of the RPC protocol
 *
 * Start() runs the inbound loop on the calling thread. Each inbound event
 * is unwrapped, checked against the encryption policy, decoded, recorded
 * in the session table and handed to the message handler. A reply from the
 * handler goes back with SendResponse(), wrapped when the policy says so.
 * A bad event is logged and dropped; the loop keeps running.
 */
class ServerTransport {
public:
    [[nodiscard]] static Result<std::unique_ptr<ServerTransport>, TransportFailure> Create(
        std::shared_ptr<interfaces::IRelayClient> relay_client,
        configuration::ServerTransportConfig config);

    ServerTransport(const ServerTransport&) = delete;
    ServerTransport& operator=(const ServerTransport&) = delete;
    ServerTransport(ServerTransport&&) = delete;
    ServerTransport& operator=(ServerTransport&&) = delete;
    ~ServerTransport();

    void SetMessageHandler(std::shared_ptr<interfaces::IMessageHandler> handler);

    /// Publishes the server announcement. Fails with Other when no
    /// server_info is configured. Returns the event id.
    [[nodiscard]] Result<std::string, TransportFailure> Announce();

    [[nodiscard]] Result<std::string, TransportFailure> PublishTools(const google::protobuf::ListValue& tools);
    [[nodiscard]] Result<std::string, TransportFailure> PublishResources(const google::protobuf::ListValue& resources);
    [[nodiscard]] Result<std::string, TransportFailure> PublishResourceTemplates(
        const google::protobuf::ListValue& resource_templates);
    [[nodiscard]] Result<std::string, TransportFailure> PublishPrompts(const google::protobuf::ListValue& prompts);

    /// Announces, subscribes and processes inbound events until Stop() is
    /// called or the subscription ends.
    [[nodiscard]] Result<Unit, TransportFailure> Start();

    /// Ends the running loop. A stop requested while no loop is subscribed
    /// is held until the next Start() subscribes, which then returns at
    /// once; the request is cleared when that loop exits.
    void Stop();

    /// Returns the id of the event actually published: the gift wrap's id
    /// when @p use_encryption is set, the reply's own id otherwise.
    [[nodiscard]] Result<std::string, TransportFailure> SendResponse(
        std::string_view client_pubkey,
        const protocol::McpMessage& payload,
        std::string_view request_event_id,
        bool use_encryption);

    /// Removes sessions idle for longer than session_timeout.
    size_t CleanupInactiveSessions();

    [[nodiscard]] Result<protocol::ClientSession, TransportFailure> GetSession(std::string_view client_pubkey) const;
    [[nodiscard]] size_t SessionCount() const;

    /// True while the inbound loop is subscribed.
    [[nodiscard]] bool IsRunning() const;

    /// Empty until the relay connection is established.
    [[nodiscard]] std::string PublicKey() const;

    [[nodiscard]] const configuration::ServerTransportConfig& Config() const noexcept { return config_; }

private:
    ServerTransport(std::shared_ptr<interfaces::IRelayClient> relay_client,
                    configuration::ServerTransportConfig config);

    [[nodiscard]] Result<std::string, TransportFailure> EnsureConnected();

    [[nodiscard]] Result<std::string, TransportFailure> PublishCapabilityList(
        uint32_t kind,
        std::string_view key,
        const google::protobuf::ListValue& items);

    [[nodiscard]] Result<std::string, TransportFailure> SignAndPublish(proto::nostr::Event unsigned_event);

    [[nodiscard]] Result<Unit, TransportFailure> HandleEvent(const proto::nostr::Event& event);

    std::shared_ptr<interfaces::IRelayClient> relay_client_;
    const configuration::ServerTransportConfig config_;
    protocol::SessionTable sessions_;

    mutable std::mutex handler_lock_;
    std::shared_ptr<interfaces::IMessageHandler> handler_;

    mutable std::mutex lifecycle_lock_;
    std::atomic<bool> started_{false};
    bool stop_requested_ = false;
    std::string own_pubkey_;
    std::shared_ptr<relay::NotificationStream> stream_;
};
}
