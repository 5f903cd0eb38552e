#include "contextvm/relay/local_relay_client.hpp"
#include "contextvm/protocol/event_builder.hpp"
#include "contextvm/crypto/sodium_interop.hpp"
#include "contextvm/core/constants.hpp"
#include "contextvm/core/format.hpp"
#include "contextvm/debug/transport_logger.hpp"
#include <algorithm>
#include <optional>
#include <unordered_set>

namespace contextvm::relay {
    using protocol::EventBuilder;
    using identity::SignerKeys;

    namespace {
        constexpr std::string_view LOG_COMPONENT = "LocalRelayClient";

        Result<std::string, TransportFailure> NotConnected() {
            return Result<std::string, TransportFailure>::Err(
                TransportFailure::Transport(std::string(ErrorMessages::NOT_CONNECTED)));
        }
    }

    LocalRelayClient::LocalRelayClient(SignerKeys keys, RelayDirectory known_relays,
                                       const size_t seen_event_capacity)
        : keys_(std::move(keys))
          , known_relays_(std::move(known_relays))
          , seen_event_capacity_(seen_event_capacity) {
    }

    LocalRelayClient::~LocalRelayClient() {
        Disconnect();
    }

    Result<std::shared_ptr<LocalRelayClient>, TransportFailure> LocalRelayClient::Create(
        SignerKeys keys,
        RelayDirectory known_relays,
        const size_t seen_event_capacity) {
        if (seen_event_capacity == 0) {
            return Result<std::shared_ptr<LocalRelayClient>, TransportFailure>::Err(
                TransportFailure::Other("seen_event_capacity must be positive"));
        }
        if (auto init = crypto::SodiumInterop::Initialize(); init.IsErr()) {
            return Result<std::shared_ptr<LocalRelayClient>, TransportFailure>::Err(
                TransportFailure::FromSodiumFailure(init.UnwrapErr()));
        }
        return Result<std::shared_ptr<LocalRelayClient>, TransportFailure>::Ok(
            std::shared_ptr<LocalRelayClient>(
                new LocalRelayClient(std::move(keys), std::move(known_relays), seen_event_capacity)));
    }

    Result<Unit, TransportFailure> LocalRelayClient::Connect(const std::vector<std::string> &relay_urls) {
        if (relay_urls.empty()) {
            return Result<Unit, TransportFailure>::Err(
                TransportFailure::Transport(std::string(ErrorMessages::NO_RELAYS)));
        }
        RelayDirectory resolved;
        for (const auto &url: relay_urls) {
            const auto it = std::find_if(known_relays_.begin(), known_relays_.end(),
                                         [&url](const auto &relay) { return relay->Url() == url; });
            if (it == known_relays_.end()) {
                return Result<Unit, TransportFailure>::Err(
                    TransportFailure::Transport(compat::format("Unreachable relay {}", url)));
            }
            resolved.push_back(*it);
        }

        std::lock_guard guard(lock_);
        for (auto &relay: resolved) {
            if (std::find(connected_.begin(), connected_.end(), relay) == connected_.end()) {
                connected_.push_back(std::move(relay));
            }
        }
        CVM_LOG_DEBUG(LOG_COMPONENT, "{} connected to {} relay(s)", keys_.PublicKeyHex(), connected_.size());
        return Result<Unit, TransportFailure>::Ok(unit);
    }

    void LocalRelayClient::Release(const ActiveSubscription &subscription) {
        for (const auto &[relay, subscription_id]: subscription.registrations) {
            relay->Unsubscribe(subscription_id);
        }
        subscription.stream->Close();
    }

    void LocalRelayClient::Disconnect() {
        std::vector<ActiveSubscription> subscriptions;
        {
            std::lock_guard guard(lock_);
            subscriptions.swap(subscriptions_);
            connected_.clear();
        }
        for (const auto &subscription: subscriptions) {
            Release(subscription);
        }
    }

    void LocalRelayClient::Unsubscribe(const std::shared_ptr<NotificationStream> &stream) {
        std::optional<ActiveSubscription> removed;
        {
            std::lock_guard guard(lock_);
            const auto it = std::find_if(subscriptions_.begin(), subscriptions_.end(),
                                         [&stream](const auto &entry) { return entry.stream == stream; });
            if (it != subscriptions_.end()) {
                removed = std::move(*it);
                subscriptions_.erase(it);
            }
        }
        if (removed) {
            Release(*removed);
        } else if (stream) {
            stream->Close();
        }
    }

    bool LocalRelayClient::IsConnected() const {
        std::lock_guard guard(lock_);
        return !connected_.empty();
    }

    size_t LocalRelayClient::SubscriptionCount() const {
        std::lock_guard guard(lock_);
        return subscriptions_.size();
    }

    size_t LocalRelayClient::SeenEventCount(const std::shared_ptr<NotificationStream> &stream) const {
        std::lock_guard guard(lock_);
        const auto it = std::find_if(subscriptions_.begin(), subscriptions_.end(),
                                     [&stream](const auto &entry) { return entry.stream == stream; });
        return it == subscriptions_.end() ? 0 : it->seen->Size();
    }

    LocalRelayClient::RelayDirectory LocalRelayClient::ConnectedRelays() const {
        std::lock_guard guard(lock_);
        return connected_;
    }

    Result<std::string, TransportFailure> LocalRelayClient::PublicKey() const {
        return Result<std::string, TransportFailure>::Ok(keys_.PublicKeyHex());
    }

    Result<proto::nostr::Event, TransportFailure> LocalRelayClient::SignWith(
        const SignerKeys &keys,
        proto::nostr::Event event) {
        event.set_pubkey(keys.PublicKeyHex());
        event.set_id(EventBuilder::ComputeId(event));
        auto signature = keys.SignEventId(event.id());
        if (signature.IsErr()) {
            return Result<proto::nostr::Event, TransportFailure>::Err(signature.UnwrapErr());
        }
        event.set_sig(std::move(signature).Unwrap());
        return Result<proto::nostr::Event, TransportFailure>::Ok(std::move(event));
    }

    Result<proto::nostr::Event, TransportFailure> LocalRelayClient::Sign(proto::nostr::Event unsigned_event) {
        return SignWith(keys_, std::move(unsigned_event));
    }

    Result<std::string, TransportFailure> LocalRelayClient::Publish(const proto::nostr::Event &event) {
        const auto relays = ConnectedRelays();
        if (relays.empty()) {
            return NotConnected();
        }
        std::optional<TransportFailure> last_failure;
        size_t accepted = 0;
        for (const auto &relay: relays) {
            auto result = relay->Publish(event);
            if (result.IsErr()) {
                last_failure = result.UnwrapErr();
                continue;
            }
            ++accepted;
        }
        if (accepted == 0) {
            return Result<std::string, TransportFailure>::Err(*last_failure);
        }
        return Result<std::string, TransportFailure>::Ok(event.id());
    }

    Result<std::shared_ptr<NotificationStream>, TransportFailure> LocalRelayClient::Subscribe(
        const proto::nostr::Filter &filter) {
        const auto relays = ConnectedRelays();
        if (relays.empty()) {
            return Result<std::shared_ptr<NotificationStream>, TransportFailure>::Err(
                TransportFailure::Transport(std::string(ErrorMessages::NOT_CONNECTED)));
        }

        ActiveSubscription subscription{
            .stream = std::make_shared<NotificationStream>(),
            .seen = std::make_shared<SeenEventCache>(seen_event_capacity_),
            .registrations = {}
        };
        auto delivery = [stream = subscription.stream, seen = subscription.seen](const proto::nostr::Event &event) {
            if (!LocalRelay::VerifyEvent(event)) {
                CVM_LOG_WARN(LOG_COMPONENT, "Dropping event {} with an invalid signature", event.id());
                return !stream->IsClosed();
            }
            if (!seen->Record(event.id())) {
                return !stream->IsClosed();
            }
            return stream->Push(event);
        };

        subscription.registrations.reserve(relays.size());
        for (const auto &relay: relays) {
            subscription.registrations.emplace_back(relay, relay->Subscribe(filter, delivery));
        }

        auto stream = subscription.stream;
        std::lock_guard guard(lock_);
        subscriptions_.push_back(std::move(subscription));
        return Result<std::shared_ptr<NotificationStream>, TransportFailure>::Ok(std::move(stream));
    }

    Result<std::vector<proto::nostr::Event>, TransportFailure> LocalRelayClient::Fetch(
        const proto::nostr::Filter &filter) {
        const auto relays = ConnectedRelays();
        if (relays.empty()) {
            return Result<std::vector<proto::nostr::Event>, TransportFailure>::Err(
                TransportFailure::Transport(std::string(ErrorMessages::NOT_CONNECTED)));
        }
        std::vector<proto::nostr::Event> events;
        std::unordered_set<std::string> seen_ids;
        for (const auto &relay: relays) {
            for (auto &event: relay->Query(filter)) {
                if (LocalRelay::VerifyEvent(event) && seen_ids.insert(event.id()).second) {
                    events.push_back(std::move(event));
                }
            }
        }
        return Result<std::vector<proto::nostr::Event>, TransportFailure>::Ok(std::move(events));
    }

    Result<std::string, TransportFailure> LocalRelayClient::Encrypt(
        const std::string_view recipient_pubkey,
        const std::string_view plaintext) {
        return keys_.EncryptTo(recipient_pubkey, plaintext);
    }

    Result<std::string, TransportFailure> LocalRelayClient::Decrypt(
        const std::string_view sender_pubkey,
        const std::string_view ciphertext) {
        return keys_.DecryptFrom(sender_pubkey, ciphertext);
    }

    Result<proto::nostr::Event, TransportFailure> LocalRelayClient::WrapFor(
        const std::string_view recipient_pubkey,
        const proto::nostr::Event &rumor) {
        using ResultType = Result<proto::nostr::Event, TransportFailure>;
        if (rumor.pubkey() != keys_.PublicKeyHex()) {
            return ResultType::Err(TransportFailure::Encryption("Cannot seal an event authored by another key"));
        }
        auto inner = EventBuilder::StripSignature(rumor);
        inner.set_id(EventBuilder::ComputeId(inner));

        auto rumor_json = EventBuilder::ToJson(inner);
        CVM_TRY_ERR(ResultType, rumor_json);
        auto sealed_rumor = keys_.EncryptTo(recipient_pubkey, rumor_json.Unwrap());
        CVM_TRY_ERR(ResultType, sealed_rumor);
        auto seal = SignWith(keys_, EventBuilder::CreateUnsigned(
                                 keys_.PublicKeyHex(), EventKinds::SEAL, std::move(sealed_rumor).Unwrap()));
        CVM_TRY_ERR(ResultType, seal);

        auto one_time_keys = SignerKeys::Generate();
        CVM_TRY_ERR(ResultType, one_time_keys);
        const SignerKeys &wrap_keys = one_time_keys.Unwrap();
        auto seal_json = EventBuilder::ToJson(seal.Unwrap());
        CVM_TRY_ERR(ResultType, seal_json);
        auto wrapped_seal = wrap_keys.EncryptTo(recipient_pubkey, seal_json.Unwrap());
        CVM_TRY_ERR(ResultType, wrapped_seal);

        auto wrap = EventBuilder::CreateUnsigned(
            wrap_keys.PublicKeyHex(), EventKinds::GIFT_WRAP, std::move(wrapped_seal).Unwrap());
        EventBuilder::AddRecipientTag(wrap, recipient_pubkey);
        return SignWith(wrap_keys, std::move(wrap));
    }

    Result<interfaces::UnwrappedEvent, TransportFailure> LocalRelayClient::Unwrap(const proto::nostr::Event &event) {
        using ResultType = Result<interfaces::UnwrappedEvent, TransportFailure>;
        if (event.kind() != EventKinds::GIFT_WRAP) {
            return ResultType::Ok(interfaces::UnwrappedEvent{
                .rumor = event,
                .sender_pubkey = event.pubkey(),
                .was_wrapped = false
            });
        }

        auto seal_json = keys_.DecryptFrom(event.pubkey(), event.content());
        if (seal_json.IsErr()) {
            return ResultType::Err(TransportFailure::Decryption(
                compat::format("Cannot open gift wrap {}: {}", event.id(), seal_json.UnwrapErr().message)));
        }
        auto seal = EventBuilder::FromJson(seal_json.Unwrap());
        if (seal.IsErr()) {
            return ResultType::Err(TransportFailure::Decryption(seal.UnwrapErr().message));
        }
        const auto &seal_event = seal.Unwrap();
        if (seal_event.kind() != EventKinds::SEAL || !LocalRelay::VerifyEvent(seal_event)) {
            return ResultType::Err(TransportFailure::Decryption(
                compat::format("Gift wrap {} carries an invalid seal", event.id())));
        }

        auto rumor_json = keys_.DecryptFrom(seal_event.pubkey(), seal_event.content());
        if (rumor_json.IsErr()) {
            return ResultType::Err(TransportFailure::Decryption(rumor_json.UnwrapErr().message));
        }
        auto rumor = EventBuilder::FromJson(rumor_json.Unwrap());
        if (rumor.IsErr()) {
            return ResultType::Err(TransportFailure::Decryption(rumor.UnwrapErr().message));
        }
        auto inner = EventBuilder::StripSignature(std::move(rumor).Unwrap());
        if (inner.pubkey() != seal_event.pubkey()) {
            return ResultType::Err(TransportFailure::Decryption("Rumor author does not match the seal signer"));
        }
        inner.set_id(EventBuilder::ComputeId(inner));

        return ResultType::Ok(interfaces::UnwrappedEvent{
            .rumor = std::move(inner),
            .sender_pubkey = seal_event.pubkey(),
            .was_wrapped = true
        });
    }
}
