#pragma once
#include "contextvm/core/result.hpp"
#include "contextvm/core/failures.hpp"
#include "nostr/event.pb.h"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
namespace contextvm::relay {

/**
 * @brief In-process relay
 *
 * Accepts signed events, keeps the latest addressable event per
 * (author, kind), keeps regular events, never keeps ephemeral ones, and
 * fans every accepted event out to the matching subscriptions.
 *
 * Delivery runs on the publishing thread with no relay lock held. A
 * delivery callback returning false cancels its subscription.
 */
class LocalRelay {
public:
    using Delivery = std::function<bool(const proto::nostr::Event&)>;

    explicit LocalRelay(std::string url);
    LocalRelay(const LocalRelay&) = delete;
    LocalRelay& operator=(const LocalRelay&) = delete;

    [[nodiscard]] const std::string& Url() const noexcept { return url_; }

    /// Rejects events whose id or signature does not verify.
    [[nodiscard]] Result<std::string, TransportFailure> Publish(const proto::nostr::Event& event);

    uint64_t Subscribe(proto::nostr::Filter filter, Delivery delivery);
    void Unsubscribe(uint64_t subscription_id);

    [[nodiscard]] std::vector<proto::nostr::Event> Query(const proto::nostr::Filter& filter) const;

    [[nodiscard]] size_t SubscriptionCount() const;
    [[nodiscard]] size_t StoredEventCount() const;

    /// True when the id matches the event fields and the signature verifies.
    [[nodiscard]] static bool VerifyEvent(const proto::nostr::Event& event);

private:
    struct Subscription {
        uint64_t id;
        proto::nostr::Filter filter;
        Delivery delivery;
    };

    void Store(const proto::nostr::Event& event);

    const std::string url_;
    mutable std::mutex lock_;
    uint64_t next_subscription_id_ = 1;
    std::vector<Subscription> subscriptions_;
    std::map<std::pair<std::string, uint32_t>, proto::nostr::Event> addressable_;
    std::vector<proto::nostr::Event> regular_;
};
}
