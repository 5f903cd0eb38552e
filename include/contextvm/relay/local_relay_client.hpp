#pragma once
#include "contextvm/interfaces/i_relay_client.hpp"
#include "contextvm/identity/signer_keys.hpp"
#include "contextvm/relay/local_relay.hpp"
#include "contextvm/relay/seen_event_cache.hpp"
#include "contextvm/core/constants.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
namespace contextvm::relay {

/**
 * @brief IRelayClient over in-process relays
 *
 * Connect() resolves URLs against the relays this client was created
 * with. Events are published to every connected relay; subscriptions
 * drop events with a bad signature and deliver each event id once even
 * when several relays carry it. Each subscription remembers the last
 * `seen_event_capacity` ids it delivered.
 *
 * Gift wraps follow the three-layer scheme: the rumor is encrypted into a
 * kind 13 seal signed by the sender, and the seal is encrypted into a
 * kind 1059 wrap signed by a one-time key and tagged with the recipient.
 */
class LocalRelayClient : public interfaces::IRelayClient {
public:
    using RelayDirectory = std::vector<std::shared_ptr<LocalRelay>>;

    [[nodiscard]] static Result<std::shared_ptr<LocalRelayClient>, TransportFailure> Create(
        identity::SignerKeys keys,
        RelayDirectory known_relays,
        size_t seen_event_capacity = ProtocolConstants::SEEN_EVENT_CACHE_CAPACITY);

    LocalRelayClient(const LocalRelayClient&) = delete;
    LocalRelayClient& operator=(const LocalRelayClient&) = delete;
    ~LocalRelayClient() override;

    [[nodiscard]] Result<Unit, TransportFailure> Connect(const std::vector<std::string>& relay_urls) override;
    void Disconnect() override;
    [[nodiscard]] Result<std::string, TransportFailure> PublicKey() const override;
    [[nodiscard]] Result<proto::nostr::Event, TransportFailure> Sign(proto::nostr::Event unsigned_event) override;
    [[nodiscard]] Result<std::string, TransportFailure> Publish(const proto::nostr::Event& event) override;
    [[nodiscard]] Result<std::shared_ptr<NotificationStream>, TransportFailure> Subscribe(
        const proto::nostr::Filter& filter) override;
    void Unsubscribe(const std::shared_ptr<NotificationStream>& stream) override;
    [[nodiscard]] Result<std::vector<proto::nostr::Event>, TransportFailure> Fetch(
        const proto::nostr::Filter& filter) override;
    [[nodiscard]] Result<std::string, TransportFailure> Encrypt(
        std::string_view recipient_pubkey,
        std::string_view plaintext) override;
    [[nodiscard]] Result<std::string, TransportFailure> Decrypt(
        std::string_view sender_pubkey,
        std::string_view ciphertext) override;
    [[nodiscard]] Result<proto::nostr::Event, TransportFailure> WrapFor(
        std::string_view recipient_pubkey,
        const proto::nostr::Event& rumor) override;
    [[nodiscard]] Result<interfaces::UnwrappedEvent, TransportFailure> Unwrap(const proto::nostr::Event& event) override;

    [[nodiscard]] bool IsConnected() const;
    [[nodiscard]] size_t SubscriptionCount() const;
    /// Ids currently remembered for de-duplication on @p stream; 0 when it
    /// is not an active subscription of this client.
    [[nodiscard]] size_t SeenEventCount(const std::shared_ptr<NotificationStream>& stream) const;

private:
    struct ActiveSubscription {
        std::shared_ptr<NotificationStream> stream;
        std::shared_ptr<SeenEventCache> seen;
        std::vector<std::pair<std::shared_ptr<LocalRelay>, uint64_t>> registrations;
    };

    LocalRelayClient(identity::SignerKeys keys, RelayDirectory known_relays, size_t seen_event_capacity);

    static void Release(const ActiveSubscription& subscription);

    [[nodiscard]] static Result<proto::nostr::Event, TransportFailure> SignWith(
        const identity::SignerKeys& keys,
        proto::nostr::Event event);

    [[nodiscard]] RelayDirectory ConnectedRelays() const;

    identity::SignerKeys keys_;
    const RelayDirectory known_relays_;
    const size_t seen_event_capacity_;

    mutable std::mutex lock_;
    RelayDirectory connected_;
    std::vector<ActiveSubscription> subscriptions_;
};
}
