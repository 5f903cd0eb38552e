#include "contextvm/relay/local_relay.hpp"
#include "contextvm/protocol/event_builder.hpp"
#include "contextvm/protocol/event_filter.hpp"
#include "contextvm/identity/signer_keys.hpp"
#include "contextvm/core/constants.hpp"
#include "contextvm/core/format.hpp"
#include "contextvm/debug/transport_logger.hpp"
#include <algorithm>

namespace contextvm::relay {
    using protocol::EventBuilder;

    namespace {
        constexpr std::string_view LOG_COMPONENT = "LocalRelay";
    }

    LocalRelay::LocalRelay(std::string url)
        : url_(std::move(url)) {
    }

    bool LocalRelay::VerifyEvent(const proto::nostr::Event &event) {
        if (event.sig().empty() || event.id() != EventBuilder::ComputeId(event)) {
            return false;
        }
        return identity::SignerKeys::VerifyEventSignature(event.pubkey(), event.id(), event.sig());
    }

    Result<std::string, TransportFailure> LocalRelay::Publish(const proto::nostr::Event &event) {
        if (!VerifyEvent(event)) {
            return Result<std::string, TransportFailure>::Err(
                TransportFailure::Transport(compat::format(
                    "{} rejected event {}: invalid id or signature", url_, event.id())));
        }

        std::vector<std::pair<uint64_t, Delivery>> targets;
        {
            std::lock_guard guard(lock_);
            Store(event);
            for (const auto &subscription: subscriptions_) {
                if (protocol::Matches(subscription.filter, event)) {
                    targets.emplace_back(subscription.id, subscription.delivery);
                }
            }
        }

        CVM_LOG_DEBUG(LOG_COMPONENT, "{} kind {} from {} -> {} subscriber(s)",
                      url_, event.kind(), event.pubkey(), targets.size());

        for (const auto &[subscription_id, delivery]: targets) {
            if (!delivery(event)) {
                Unsubscribe(subscription_id);
            }
        }
        return Result<std::string, TransportFailure>::Ok(event.id());
    }

    void LocalRelay::Store(const proto::nostr::Event &event) {
        switch (RetentionOf(event.kind())) {
            case KindRetention::Ephemeral:
                return;
            case KindRetention::Addressable: {
                auto key = std::make_pair(event.pubkey(), event.kind());
                const auto it = addressable_.find(key);
                if (it == addressable_.end() || it->second.created_at() <= event.created_at()) {
                    addressable_.insert_or_assign(std::move(key), event);
                }
                return;
            }
            case KindRetention::Regular:
                regular_.push_back(event);
                return;
        }
    }

    uint64_t LocalRelay::Subscribe(proto::nostr::Filter filter, Delivery delivery) {
        std::lock_guard guard(lock_);
        const uint64_t id = next_subscription_id_++;
        subscriptions_.push_back(Subscription{
            .id = id,
            .filter = std::move(filter),
            .delivery = std::move(delivery)
        });
        return id;
    }

    void LocalRelay::Unsubscribe(const uint64_t subscription_id) {
        std::lock_guard guard(lock_);
        std::erase_if(subscriptions_, [subscription_id](const Subscription &subscription) {
            return subscription.id == subscription_id;
        });
    }

    std::vector<proto::nostr::Event> LocalRelay::Query(const proto::nostr::Filter &filter) const {
        std::lock_guard guard(lock_);
        std::vector<proto::nostr::Event> matches;
        for (const auto &[key, event]: addressable_) {
            if (protocol::Matches(filter, event)) {
                matches.push_back(event);
            }
        }
        for (const auto &event: regular_) {
            if (protocol::Matches(filter, event)) {
                matches.push_back(event);
            }
        }
        std::sort(matches.begin(), matches.end(), [](const auto &a, const auto &b) {
            return a.created_at() > b.created_at();
        });
        return matches;
    }

    size_t LocalRelay::SubscriptionCount() const {
        std::lock_guard guard(lock_);
        return subscriptions_.size();
    }

    size_t LocalRelay::StoredEventCount() const {
        std::lock_guard guard(lock_);
        return addressable_.size() + regular_.size();
    }
}
