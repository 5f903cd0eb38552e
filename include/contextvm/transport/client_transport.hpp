#pragma once
#include "contextvm/core/result.hpp"
#include "contextvm/core/failures.hpp"
#include "contextvm/configuration/transport_config.hpp"
#include "contextvm/interfaces/i_relay_client.hpp"
#include "contextvm/protocol/mcp_message.hpp"
#include "contextvm/protocol/pending_request_table.hpp"
#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
namespace contextvm::transport {

/**
 * @brief Requesting side of the RPC protocol
 *
 * SendRequest may be called from any number of threads. Replies are
 * matched to requests by the `e` tag, which carries the id of the signed
 * inner request event whether or not the request went out gift-wrapped.
 * A single drain thread, started by Connect(), consumes the inbound
 * subscription.
 */
class ClientTransport {
public:
    [[nodiscard]] static Result<std::unique_ptr<ClientTransport>, TransportFailure> Create(
        std::shared_ptr<interfaces::IRelayClient> relay_client,
        configuration::ClientTransportConfig config);

    ClientTransport(const ClientTransport&) = delete;
    ClientTransport& operator=(const ClientTransport&) = delete;
    ClientTransport(ClientTransport&&) = delete;
    ClientTransport& operator=(ClientTransport&&) = delete;
    ~ClientTransport();

    /// Connects, subscribes to replies addressed to this identity and starts
    /// the drain thread. Calling it again while connected does nothing.
    [[nodiscard]] Result<Unit, TransportFailure> Connect();

    /// Sends @p request to @p server_pubkey and blocks until the matching
    /// reply arrives or the request timeout elapses.
    [[nodiscard]] Result<protocol::McpMessage, TransportFailure> SendRequest(
        std::string_view server_pubkey,
        const protocol::McpMessage& request,
        bool use_encryption);

    /// Ends this transport's subscription and stops the drain thread. The
    /// relay client stays connected. Requests still waiting fail with Transport.
    void Disconnect();

    [[nodiscard]] bool IsConnected() const noexcept;
    [[nodiscard]] size_t PendingRequestCount() const;
    [[nodiscard]] const configuration::ClientTransportConfig& Config() const noexcept { return config_; }

    /// Empty until Connect() succeeds.
    [[nodiscard]] std::string PublicKey() const;

private:
    ClientTransport(std::shared_ptr<interfaces::IRelayClient> relay_client,
                    configuration::ClientTransportConfig config);

    [[nodiscard]] Result<std::string, TransportFailure> Transmit(
        std::string_view server_pubkey,
        const proto::nostr::Event& signed_request,
        bool encrypt);

    void DrainLoop(std::shared_ptr<relay::NotificationStream> stream);
    void HandleInbound(const proto::nostr::Event& event);

    std::shared_ptr<interfaces::IRelayClient> relay_client_;
    const configuration::ClientTransportConfig config_;
    protocol::PendingRequestTable pending_;

    mutable std::mutex lifecycle_lock_;
    std::atomic<bool> started_{false};
    std::string own_pubkey_;
    std::shared_ptr<relay::NotificationStream> stream_;
    std::thread drain_thread_;
};
}
