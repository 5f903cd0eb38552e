#pragma once
#include "contextvm/core/result.hpp"
#include "contextvm/core/failures.hpp"
#include "contextvm/relay/notification_stream.hpp"
#include "nostr/event.pb.h"
#include <memory>
#include <string>
#include <string_view>
#include <vector>
namespace contextvm::interfaces {
struct UnwrappedEvent {
    /// The inner event. Equal to the input when it was not a gift wrap.
    proto::nostr::Event rumor;
    /// Real author of the rumor (not the ephemeral wrap key)
    std::string sender_pubkey;
    bool was_wrapped = false;
};

/**
 * @brief Network client the transports publish and subscribe through
 *
 * Implementations own relay connections, signing keys and the
 * encryption primitives. The transports never touch key material.
 */
class IRelayClient {
public:
    virtual ~IRelayClient() = default;

    [[nodiscard]] virtual Result<Unit, TransportFailure> Connect(const std::vector<std::string>& relay_urls) = 0;
    /// Closes every subscription of this client. A client shared between
    /// transports is disconnected for all of them.
    virtual void Disconnect() = 0;

    [[nodiscard]] virtual Result<std::string, TransportFailure> PublicKey() const = 0;

    /// Fills in id and signature of an unsigned event.
    [[nodiscard]] virtual Result<proto::nostr::Event, TransportFailure> Sign(proto::nostr::Event unsigned_event) = 0;

    /// Returns the id of the published event.
    [[nodiscard]] virtual Result<std::string, TransportFailure> Publish(const proto::nostr::Event& event) = 0;

    [[nodiscard]] virtual Result<std::shared_ptr<relay::NotificationStream>, TransportFailure> Subscribe(
        const proto::nostr::Filter& filter) = 0;

    /// Ends one subscription and closes its stream. Other subscriptions on
    /// this client are untouched.
    virtual void Unsubscribe(const std::shared_ptr<relay::NotificationStream>& stream) = 0;

    /// Stored events matching @p filter.
    [[nodiscard]] virtual Result<std::vector<proto::nostr::Event>, TransportFailure> Fetch(
        const proto::nostr::Filter& filter) = 0;

    [[nodiscard]] virtual Result<std::string, TransportFailure> Encrypt(
        std::string_view recipient_pubkey,
        std::string_view plaintext) = 0;

    [[nodiscard]] virtual Result<std::string, TransportFailure> Decrypt(
        std::string_view sender_pubkey,
        std::string_view ciphertext) = 0;

    /// Seals @p rumor for @p recipient_pubkey and wraps it in a kind 1059
    /// event signed by a one-time key. The rumor id is preserved.
    [[nodiscard]] virtual Result<proto::nostr::Event, TransportFailure> WrapFor(
        std::string_view recipient_pubkey,
        const proto::nostr::Event& rumor) = 0;

    /// Opens a gift wrap. Any other event is returned as-is with
    /// was_wrapped = false.
    [[nodiscard]] virtual Result<UnwrappedEvent, TransportFailure> Unwrap(const proto::nostr::Event& event) = 0;
};
}
