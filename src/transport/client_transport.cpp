#include "contextvm/transport/client_transport.hpp"
#include "contextvm/protocol/encryption_policy.hpp"
#include "contextvm/protocol/event_builder.hpp"
#include "contextvm/protocol/event_filter.hpp"
#include "contextvm/core/constants.hpp"
#include "contextvm/core/format.hpp"
#include "contextvm/debug/transport_logger.hpp"
#include <future>

namespace contextvm::transport {
    using protocol::EventBuilder;
    using protocol::McpMessage;

    namespace {
        constexpr std::string_view LOG_COMPONENT = "ClientTransport";
    }

    ClientTransport::ClientTransport(std::shared_ptr<interfaces::IRelayClient> relay_client,
                                     configuration::ClientTransportConfig config)
        : relay_client_(std::move(relay_client))
          , config_(std::move(config)) {
    }

    ClientTransport::~ClientTransport() {
        Disconnect();
    }

    Result<std::unique_ptr<ClientTransport>, TransportFailure> ClientTransport::Create(
        std::shared_ptr<interfaces::IRelayClient> relay_client,
        configuration::ClientTransportConfig config) {
        using ResultType = Result<std::unique_ptr<ClientTransport>, TransportFailure>;
        if (!relay_client) {
            return ResultType::Err(TransportFailure::Other("Relay client must not be null"));
        }
        CVM_TRY_ERR(ResultType, config.Validate());
        return ResultType::Ok(std::unique_ptr<ClientTransport>(
            new ClientTransport(std::move(relay_client), std::move(config))));
    }

    Result<Unit, TransportFailure> ClientTransport::Connect() {
        using ResultType = Result<Unit, TransportFailure>;
        std::lock_guard guard(lifecycle_lock_);
        if (started_.load(std::memory_order_acquire)) {
            return ResultType::Ok(unit);
        }

        if (auto connected = relay_client_->Connect(config_.relay_urls); connected.IsErr()) {
            return connected;
        }
        auto pubkey = relay_client_->PublicKey();
        CVM_TRY_ERR(ResultType, pubkey);
        auto stream = relay_client_->Subscribe(protocol::MakeInboundFilter(pubkey.Unwrap()));
        if (stream.IsErr()) {
            return ResultType::Err(stream.UnwrapErr());
        }

        own_pubkey_ = std::move(pubkey).Unwrap();
        stream_ = std::move(stream).Unwrap();
        drain_thread_ = std::thread(&ClientTransport::DrainLoop, this, stream_);
        started_.store(true, std::memory_order_release);

        CVM_LOG_INFO(LOG_COMPONENT, "Connected as {} ({} relay(s), encryption {})",
                     own_pubkey_, config_.relay_urls.size(),
                     protocol::EncryptionModeToString(config_.encryption_mode));
        return ResultType::Ok(unit);
    }

    void ClientTransport::Disconnect() {
        std::shared_ptr<relay::NotificationStream> stream;
        std::thread worker;
        {
            std::lock_guard guard(lifecycle_lock_);
            if (!started_.exchange(false, std::memory_order_acq_rel)) {
                return;
            }
            stream = std::move(stream_);
            worker = std::move(drain_thread_);
        }
        stream->Close();
        relay_client_->Unsubscribe(stream);
        if (worker.joinable()) {
            worker.join();
        }
        pending_.Clear();
        CVM_LOG_INFO(LOG_COMPONENT, "Disconnected");
    }

    bool ClientTransport::IsConnected() const noexcept {
        return started_.load(std::memory_order_acquire);
    }

    size_t ClientTransport::PendingRequestCount() const {
        return pending_.Size();
    }

    std::string ClientTransport::PublicKey() const {
        std::lock_guard guard(lifecycle_lock_);
        return own_pubkey_;
    }

    Result<McpMessage, TransportFailure> ClientTransport::SendRequest(
        const std::string_view server_pubkey,
        const McpMessage &request,
        const bool use_encryption) {
        using ResultType = Result<McpMessage, TransportFailure>;
        if (!IsConnected()) {
            return ResultType::Err(TransportFailure::Transport(std::string(ErrorMessages::NOT_CONNECTED)));
        }

        auto content = request.ToJson();
        CVM_TRY_ERR(ResultType, content);
        CVM_TRY_ERR(ResultType, EventBuilder::ValidateContentSize(content.Unwrap()));

        auto unsigned_event = EventBuilder::CreateUnsigned(
            PublicKey(), EventKinds::CTXVM_MESSAGES, std::move(content).Unwrap());
        EventBuilder::AddRecipientTag(unsigned_event, server_pubkey);
        auto signed_result = relay_client_->Sign(std::move(unsigned_event));
        CVM_TRY_ERR(ResultType, signed_result);
        const proto::nostr::Event &signed_request = signed_result.Unwrap();
        const std::string request_id = signed_request.id();

        auto slot = pending_.Register(request_id);
        CVM_TRY_ERR(ResultType, slot);
        std::future<proto::nostr::Event> reply_future = std::move(slot).Unwrap();

        const bool encrypt = protocol::ShouldEncrypt(config_.encryption_mode, use_encryption);
        if (auto published = Transmit(server_pubkey, signed_request, encrypt); published.IsErr()) {
            pending_.Remove(request_id);
            return ResultType::Err(published.UnwrapErr());
        }
        CVM_LOG_DEBUG(LOG_COMPONENT, "Request {} sent to {} ({})",
                      request_id, server_pubkey, encrypt ? "wrapped" : "plain");

        if (reply_future.wait_for(config_.request_timeout) == std::future_status::timeout &&
            pending_.Remove(request_id)) {
            CVM_LOG_WARN(LOG_COMPONENT, "Request {} timed out after {} ms",
                         request_id, config_.request_timeout.count());
            return ResultType::Err(TransportFailure::Timeout(compat::format(
                "{} ({} ms)", ErrorMessages::REQUEST_TIMED_OUT, config_.request_timeout.count())));
        }

        proto::nostr::Event reply;
        try {
            reply = reply_future.get();
        } catch (const std::future_error &) {
            return ResultType::Err(TransportFailure::Transport(std::string(ErrorMessages::RESPONSE_CHANNEL_CLOSED)));
        }
        return McpMessage::FromJson(reply.content());
    }

    Result<std::string, TransportFailure> ClientTransport::Transmit(
        const std::string_view server_pubkey,
        const proto::nostr::Event &signed_request,
        const bool encrypt) {
        if (!encrypt) {
            return relay_client_->Publish(signed_request);
        }
        using ResultType = Result<std::string, TransportFailure>;
        auto wrapped = relay_client_->WrapFor(server_pubkey, EventBuilder::StripSignature(signed_request));
        CVM_TRY_ERR(ResultType, wrapped);
        return relay_client_->Publish(wrapped.Unwrap());
    }

    void ClientTransport::DrainLoop(std::shared_ptr<relay::NotificationStream> stream) {
        proto::nostr::Event event;
        while (stream->Next(event)) {
            HandleInbound(event);
        }
        CVM_LOG_DEBUG(LOG_COMPONENT, "Inbound stream closed");
    }

    void ClientTransport::HandleInbound(const proto::nostr::Event &event) {
        auto unwrapped_result = relay_client_->Unwrap(event);
        if (unwrapped_result.IsErr()) {
            CVM_LOG_WARN(LOG_COMPONENT, "Dropping event {}: {}", event.id(), unwrapped_result.UnwrapErr().message);
            return;
        }
        auto unwrapped = std::move(unwrapped_result).Unwrap();

        if (!unwrapped.was_wrapped && !protocol::AcceptsPlaintext(config_.encryption_mode)) {
            CVM_LOG_WARN(LOG_COMPONENT, "Dropping reply {} from {}: {}",
                         event.id(), unwrapped.sender_pubkey, ErrorMessages::PLAINTEXT_REFUSED);
            return;
        }
        if (unwrapped.rumor.kind() != EventKinds::CTXVM_MESSAGES) {
            CVM_LOG_WARN(LOG_COMPONENT, "Dropping event {} of unexpected kind {}", event.id(), unwrapped.rumor.kind());
            return;
        }

        const auto in_reply_to = EventBuilder::FindTagValue(unwrapped.rumor, TagNames::EVENT_ID);
        if (!in_reply_to.has_value()) {
            CVM_LOG_DEBUG(LOG_COMPONENT, "Ignoring event {} without a request reference", event.id());
            return;
        }
        if (!pending_.Fulfill(*in_reply_to, std::move(unwrapped.rumor))) {
            CVM_LOG_DEBUG(LOG_COMPONENT, "Discarding reply to unknown or expired request {}", *in_reply_to);
        }
    }
}
