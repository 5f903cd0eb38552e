#include "contextvm/transport/server_transport.hpp"
#include "contextvm/protocol/encryption_policy.hpp"
#include "contextvm/protocol/event_builder.hpp"
#include "contextvm/protocol/event_filter.hpp"
#include "contextvm/core/constants.hpp"
#include "contextvm/core/format.hpp"
#include "contextvm/debug/transport_logger.hpp"
#include "contextvm/capabilities.pb.h"
#include <google/protobuf/util/json_util.h>

namespace contextvm::transport {
    using protocol::EventBuilder;
    using protocol::McpMessage;
    using protocol::EncryptionMode;

    namespace {
        constexpr std::string_view LOG_COMPONENT = "ServerTransport";

        Result<std::string, TransportFailure> ToJsonDocument(const google::protobuf::Message &message) {
            std::string json;
            if (const auto status = google::protobuf::util::MessageToJsonString(message, &json); !status.ok()) {
                return Result<std::string, TransportFailure>::Err(
                    TransportFailure::Other(compat::format("Failed to serialize document: {}", status.ToString())));
            }
            return Result<std::string, TransportFailure>::Ok(std::move(json));
        }
    }

    ServerTransport::ServerTransport(std::shared_ptr<interfaces::IRelayClient> relay_client,
                                     configuration::ServerTransportConfig config)
        : relay_client_(std::move(relay_client))
          , config_(std::move(config)) {
    }

    ServerTransport::~ServerTransport() {
        Stop();
    }

    Result<std::unique_ptr<ServerTransport>, TransportFailure> ServerTransport::Create(
        std::shared_ptr<interfaces::IRelayClient> relay_client,
        configuration::ServerTransportConfig config) {
        using ResultType = Result<std::unique_ptr<ServerTransport>, TransportFailure>;
        if (!relay_client) {
            return ResultType::Err(TransportFailure::Other("Relay client must not be null"));
        }
        CVM_TRY_ERR(ResultType, config.Validate());
        return ResultType::Ok(std::unique_ptr<ServerTransport>(
            new ServerTransport(std::move(relay_client), std::move(config))));
    }

    void ServerTransport::SetMessageHandler(std::shared_ptr<interfaces::IMessageHandler> handler) {
        std::lock_guard guard(handler_lock_);
        handler_ = std::move(handler);
    }

    Result<std::string, TransportFailure> ServerTransport::EnsureConnected() {
        std::lock_guard guard(lifecycle_lock_);
        if (!own_pubkey_.empty()) {
            return Result<std::string, TransportFailure>::Ok(own_pubkey_);
        }
        if (auto connected = relay_client_->Connect(config_.relay_urls); connected.IsErr()) {
            return Result<std::string, TransportFailure>::Err(connected.UnwrapErr());
        }
        auto pubkey = relay_client_->PublicKey();
        if (pubkey.IsOk()) {
            own_pubkey_ = pubkey.Unwrap();
        }
        return pubkey;
    }

    std::string ServerTransport::PublicKey() const {
        std::lock_guard guard(lifecycle_lock_);
        return own_pubkey_;
    }

    Result<std::string, TransportFailure> ServerTransport::SignAndPublish(proto::nostr::Event unsigned_event) {
        using ResultType = Result<std::string, TransportFailure>;
        CVM_TRY_ERR(ResultType, EventBuilder::ValidateContentSize(unsigned_event.content()));
        auto signed_event = relay_client_->Sign(std::move(unsigned_event));
        CVM_TRY_ERR(ResultType, signed_event);
        return relay_client_->Publish(signed_event.Unwrap());
    }

    Result<std::string, TransportFailure> ServerTransport::Announce() {
        using ResultType = Result<std::string, TransportFailure>;
        if (!config_.server_info.has_value()) {
            return ResultType::Err(TransportFailure::Other(std::string(ErrorMessages::SERVER_INFO_MISSING)));
        }
        auto pubkey = EnsureConnected();
        CVM_TRY_ERR(ResultType, pubkey);

        const auto &info = *config_.server_info;
        proto::capabilities::ServerAnnouncement announcement;
        if (info.name) {
            announcement.set_name(*info.name);
        }
        if (info.version) {
            announcement.set_version(*info.version);
        }
        if (info.about) {
            announcement.set_about(*info.about);
        }
        auto content = ToJsonDocument(announcement);
        CVM_TRY_ERR(ResultType, content);

        auto event = EventBuilder::CreateUnsigned(
            pubkey.Unwrap(), EventKinds::SERVER_ANNOUNCEMENT, std::move(content).Unwrap());
        const std::pair<std::string_view, const std::optional<std::string> &> descriptive_tags[] = {
            {TagNames::NAME, info.name},
            {TagNames::WEBSITE, info.website},
            {TagNames::PICTURE, info.picture},
            {TagNames::ABOUT, info.about},
        };
        for (const auto &[tag_name, value]: descriptive_tags) {
            if (value.has_value()) {
                EventBuilder::AddTag(event, tag_name, *value);
            }
        }
        EventBuilder::AddTag(event, TagNames::SUPPORT_ENCRYPTION,
                             config_.encryption_mode == EncryptionMode::Disabled ? "false" : "true");

        auto published = SignAndPublish(std::move(event));
        if (published.IsOk()) {
            CVM_LOG_INFO(LOG_COMPONENT, "Published server announcement {}", published.Unwrap());
        }
        return published;
    }

    Result<std::string, TransportFailure> ServerTransport::PublishCapabilityList(
        const uint32_t kind,
        const std::string_view key,
        const google::protobuf::ListValue &items) {
        using ResultType = Result<std::string, TransportFailure>;
        auto pubkey = EnsureConnected();
        CVM_TRY_ERR(ResultType, pubkey);

        google::protobuf::Struct document;
        *(*document.mutable_fields())[std::string(key)].mutable_list_value() = items;
        auto content = ToJsonDocument(document);
        CVM_TRY_ERR(ResultType, content);

        auto published = SignAndPublish(EventBuilder::CreateUnsigned(
            pubkey.Unwrap(), kind, std::move(content).Unwrap()));
        if (published.IsOk()) {
            CVM_LOG_INFO(LOG_COMPONENT, "Published {} list ({} entries): {}",
                         key, items.values_size(), published.Unwrap());
        }
        return published;
    }

    Result<std::string, TransportFailure> ServerTransport::PublishTools(const google::protobuf::ListValue &tools) {
        return PublishCapabilityList(EventKinds::TOOLS_LIST, ProtocolConstants::TOOLS_KEY, tools);
    }

    Result<std::string, TransportFailure> ServerTransport::PublishResources(
        const google::protobuf::ListValue &resources) {
        return PublishCapabilityList(EventKinds::RESOURCES_LIST, ProtocolConstants::RESOURCES_KEY, resources);
    }

    Result<std::string, TransportFailure> ServerTransport::PublishResourceTemplates(
        const google::protobuf::ListValue &resource_templates) {
        return PublishCapabilityList(EventKinds::RESOURCE_TEMPLATES_LIST,
                                     ProtocolConstants::RESOURCE_TEMPLATES_KEY, resource_templates);
    }

    Result<std::string, TransportFailure> ServerTransport::PublishPrompts(const google::protobuf::ListValue &prompts) {
        return PublishCapabilityList(EventKinds::PROMPTS_LIST, ProtocolConstants::PROMPTS_KEY, prompts);
    }

    Result<Unit, TransportFailure> ServerTransport::Start() {
        using ResultType = Result<Unit, TransportFailure>;
        if (started_.exchange(true, std::memory_order_acq_rel)) {
            return ResultType::Err(TransportFailure::Other("Server transport is already running"));
        }

        auto subscribe = [this]() -> Result<std::shared_ptr<relay::NotificationStream>, TransportFailure> {
            using StreamResult = Result<std::shared_ptr<relay::NotificationStream>, TransportFailure>;
            CVM_TRY_ERR(StreamResult, Announce());
            return relay_client_->Subscribe(protocol::MakeInboundFilter(PublicKey()));
        };
        auto subscribed = subscribe();
        if (subscribed.IsErr()) {
            std::lock_guard guard(lifecycle_lock_);
            stop_requested_ = false;
            started_.store(false, std::memory_order_release);
            return ResultType::Err(subscribed.UnwrapErr());
        }
        auto stream = std::move(subscribed).Unwrap();
        {
            std::lock_guard guard(lifecycle_lock_);
            stream_ = stream;
            if (stop_requested_) {
                stream->Close();
            }
        }
        CVM_LOG_INFO(LOG_COMPONENT, "Listening on {} (encryption {})",
                     PublicKey(), protocol::EncryptionModeToString(config_.encryption_mode));

        proto::nostr::Event event;
        while (stream->Next(event)) {
            if (auto handled = HandleEvent(event); handled.IsErr()) {
                const auto &failure = handled.UnwrapErr();
                CVM_LOG_WARN(LOG_COMPONENT, "Dropped event {} from {}: [{}] {}",
                             event.id(), event.pubkey(), FailureTypeToString(failure.type), failure.message);
            }
        }

        relay_client_->Unsubscribe(stream);
        {
            std::lock_guard guard(lifecycle_lock_);
            stream_.reset();
            stop_requested_ = false;
            started_.store(false, std::memory_order_release);
        }
        CVM_LOG_INFO(LOG_COMPONENT, "Inbound loop stopped");
        return ResultType::Ok(unit);
    }

    void ServerTransport::Stop() {
        std::lock_guard guard(lifecycle_lock_);
        stop_requested_ = true;
        if (stream_) {
            stream_->Close();
        }
    }

    bool ServerTransport::IsRunning() const {
        std::lock_guard guard(lifecycle_lock_);
        return stream_ != nullptr && !stream_->IsClosed();
    }

    Result<Unit, TransportFailure> ServerTransport::HandleEvent(const proto::nostr::Event &event) {
        using ResultType = Result<Unit, TransportFailure>;
        if (event.kind() != EventKinds::CTXVM_MESSAGES && event.kind() != EventKinds::GIFT_WRAP) {
            return ResultType::Err(TransportFailure::Protocol(compat::format("Unexpected kind {}", event.kind())));
        }
        auto unwrapped_result = relay_client_->Unwrap(event);
        CVM_TRY_ERR(ResultType, unwrapped_result);
        auto unwrapped = std::move(unwrapped_result).Unwrap();
        const bool arrived_encrypted = unwrapped.was_wrapped;
        const proto::nostr::Event &rumor = unwrapped.rumor;

        if (!arrived_encrypted && !protocol::AcceptsPlaintext(config_.encryption_mode)) {
            return ResultType::Err(TransportFailure::EncryptionRequired(std::string(ErrorMessages::PLAINTEXT_REFUSED)));
        }
        if (rumor.kind() != EventKinds::CTXVM_MESSAGES) {
            return ResultType::Err(TransportFailure::Protocol(
                compat::format("Wrapped event has unexpected kind {}", rumor.kind())));
        }
        CVM_TRY_ERR(ResultType, EventBuilder::ValidateContentSize(rumor.content()));
        auto decoded = McpMessage::FromJson(rumor.content());
        CVM_TRY_ERR(ResultType, decoded);
        McpMessage message = std::move(decoded).Unwrap();

        const std::string &sender = unwrapped.sender_pubkey;
        const auto touch = sessions_.Touch(sender, arrived_encrypted);
        if (touch.created) {
            CVM_LOG_INFO(LOG_COMPONENT, "New session for {} ({})", sender, arrived_encrypted ? "encrypted" : "plain");
        }
        if (message.IsHandshake()) {
            sessions_.MarkInitialized(sender);
        } else if (config_.require_initialization && !touch.session.is_initialized) {
            return ResultType::Err(TransportFailure::Protocol(std::string(ErrorMessages::SESSION_NOT_INITIALIZED)));
        }

        std::shared_ptr<interfaces::IMessageHandler> handler;
        {
            std::lock_guard guard(handler_lock_);
            handler = handler_;
        }
        if (!handler) {
            CVM_LOG_DEBUG(LOG_COMPONENT, "No handler installed; message {} not dispatched", rumor.id());
            return ResultType::Ok(unit);
        }

        const interfaces::IncomingMessage incoming{
            .sender_pubkey = sender,
            .event_id = rumor.id(),
            .message = std::move(message),
            .is_encrypted = arrived_encrypted
        };
        auto reply = handler->OnMessage(incoming);
        if (!reply.has_value()) {
            return ResultType::Ok(unit);
        }
        auto sent = SendResponse(sender, *reply, rumor.id(),
                                 protocol::ShouldEncrypt(config_.encryption_mode, arrived_encrypted));
        CVM_TRY_ERR(ResultType, sent);
        return ResultType::Ok(unit);
    }

    Result<std::string, TransportFailure> ServerTransport::SendResponse(
        const std::string_view client_pubkey,
        const McpMessage &payload,
        const std::string_view request_event_id,
        const bool use_encryption) {
        using ResultType = Result<std::string, TransportFailure>;
        auto pubkey = EnsureConnected();
        CVM_TRY_ERR(ResultType, pubkey);
        auto content = payload.ToJson();
        CVM_TRY_ERR(ResultType, content);
        CVM_TRY_ERR(ResultType, EventBuilder::ValidateContentSize(content.Unwrap()));

        auto event = EventBuilder::CreateUnsigned(
            pubkey.Unwrap(), EventKinds::CTXVM_MESSAGES, std::move(content).Unwrap());
        EventBuilder::AddRecipientTag(event, client_pubkey);
        EventBuilder::AddReplyTag(event, request_event_id);
        auto signed_event = relay_client_->Sign(std::move(event));
        CVM_TRY_ERR(ResultType, signed_event);

        if (!use_encryption) {
            return relay_client_->Publish(signed_event.Unwrap());
        }
        auto wrapped = relay_client_->WrapFor(client_pubkey, EventBuilder::StripSignature(signed_event.Unwrap()));
        CVM_TRY_ERR(ResultType, wrapped);
        return relay_client_->Publish(wrapped.Unwrap());
    }

    size_t ServerTransport::CleanupInactiveSessions() {
        const size_t removed = sessions_.CleanupInactive(config_.session_timeout);
        if (removed > 0) {
            CVM_LOG_INFO(LOG_COMPONENT, "Evicted {} inactive session(s), {} remaining", removed, sessions_.Size());
        }
        return removed;
    }

    Result<protocol::ClientSession, TransportFailure> ServerTransport::GetSession(
        const std::string_view client_pubkey) const {
        return sessions_.Find(client_pubkey);
    }

    size_t ServerTransport::SessionCount() const {
        return sessions_.Size();
    }
}
