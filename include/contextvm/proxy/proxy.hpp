#pragma once
#include "contextvm/core/result.hpp"
#include "contextvm/core/failures.hpp"
#include "contextvm/transport/client_transport.hpp"
#include <memory>
#include <string_view>
namespace contextvm::proxy {

/// Forwards local requests to a remote server through a client transport.
class Proxy {
public:
    [[nodiscard]] static Result<std::unique_ptr<Proxy>, TransportFailure> Create(
        std::shared_ptr<interfaces::IRelayClient> relay_client,
        configuration::ClientTransportConfig config);

    explicit Proxy(std::unique_ptr<transport::ClientTransport> transport);
    Proxy(const Proxy&) = delete;
    Proxy& operator=(const Proxy&) = delete;

    [[nodiscard]] Result<Unit, TransportFailure> Connect();

    [[nodiscard]] Result<protocol::McpMessage, TransportFailure> Request(
        std::string_view server_pubkey,
        const protocol::McpMessage& message,
        bool use_encryption);

    void Disconnect();

    [[nodiscard]] transport::ClientTransport& Transport() noexcept { return *transport_; }

private:
    std::unique_ptr<transport::ClientTransport> transport_;
};
}
