#include "contextvm/proxy/proxy.hpp"

namespace contextvm::proxy {
    Result<std::unique_ptr<Proxy>, TransportFailure> Proxy::Create(
        std::shared_ptr<interfaces::IRelayClient> relay_client,
        configuration::ClientTransportConfig config) {
        using ResultType = Result<std::unique_ptr<Proxy>, TransportFailure>;
        auto transport = transport::ClientTransport::Create(std::move(relay_client), std::move(config));
        CVM_TRY_ERR(ResultType, transport);
        return ResultType::Ok(std::make_unique<Proxy>(std::move(transport).Unwrap()));
    }

    Proxy::Proxy(std::unique_ptr<transport::ClientTransport> transport)
        : transport_(std::move(transport)) {
    }

    Result<Unit, TransportFailure> Proxy::Connect() {
        return transport_->Connect();
    }

    Result<protocol::McpMessage, TransportFailure> Proxy::Request(
        const std::string_view server_pubkey,
        const protocol::McpMessage &message,
        const bool use_encryption) {
        return transport_->SendRequest(server_pubkey, message, use_encryption);
    }

    void Proxy::Disconnect() {
        transport_->Disconnect();
    }
}
