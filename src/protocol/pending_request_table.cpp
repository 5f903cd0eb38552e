#include "contextvm/protocol/pending_request_table.hpp"
#include "contextvm/core/format.hpp"
#include <mutex>
#include <optional>

namespace contextvm::protocol {
    Result<std::future<proto::nostr::Event>, TransportFailure> PendingRequestTable::Register(
        const std::string &request_id) {
        std::promise<proto::nostr::Event> slot;
        auto future = slot.get_future();
        {
            std::unique_lock guard(lock_);
            if (!pending_.try_emplace(request_id, std::move(slot)).second) {
                return Result<std::future<proto::nostr::Event>, TransportFailure>::Err(
                    TransportFailure::Protocol(compat::format(
                        "Request {} is already awaiting a response", request_id)));
            }
        }
        return Result<std::future<proto::nostr::Event>, TransportFailure>::Ok(std::move(future));
    }

    bool PendingRequestTable::Fulfill(const std::string_view request_id, proto::nostr::Event reply) {
        std::optional<std::promise<proto::nostr::Event>> slot;
        {
            std::unique_lock guard(lock_);
            const auto it = pending_.find(std::string(request_id));
            if (it == pending_.end()) {
                return false;
            }
            slot.emplace(std::move(it->second));
            pending_.erase(it);
        }
        slot->set_value(std::move(reply));
        return true;
    }

    bool PendingRequestTable::Remove(const std::string_view request_id) {
        std::unique_lock guard(lock_);
        return pending_.erase(std::string(request_id)) > 0;
    }

    bool PendingRequestTable::Contains(const std::string_view request_id) const {
        std::shared_lock guard(lock_);
        return pending_.contains(std::string(request_id));
    }

    size_t PendingRequestTable::Size() const {
        std::shared_lock guard(lock_);
        return pending_.size();
    }

    void PendingRequestTable::Clear() {
        std::unordered_map<std::string, std::promise<proto::nostr::Event>> dropped;
        {
            std::unique_lock guard(lock_);
            dropped.swap(pending_);
        }
    }
}
