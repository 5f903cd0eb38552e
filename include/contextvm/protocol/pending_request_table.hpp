#pragma once
#include "contextvm/core/result.hpp"
#include "contextvm/core/failures.hpp"
#include "nostr/event.pb.h"
#include <cstddef>
#include <future>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
namespace contextvm::protocol {

/**
 * @brief Correlation table of outstanding requests
 *
 * Each entry is a single-use slot keyed by the id of the signed inner
 * request event. Whichever of Fulfill and Remove reaches an entry first
 * consumes it; the other finds nothing.
 */
class PendingRequestTable {
public:
    PendingRequestTable() = default;
    PendingRequestTable(const PendingRequestTable&) = delete;
    PendingRequestTable& operator=(const PendingRequestTable&) = delete;
    PendingRequestTable(PendingRequestTable&&) = delete;
    PendingRequestTable& operator=(PendingRequestTable&&) = delete;
    ~PendingRequestTable() = default;

    [[nodiscard]] Result<std::future<proto::nostr::Event>, TransportFailure> Register(const std::string& request_id);

    /// Resolves the slot of @p request_id with @p reply. Returns false when
    /// no entry exists (unsolicited or already timed out).
    bool Fulfill(std::string_view request_id, proto::nostr::Event reply);

    /// Returns false when the entry was already consumed.
    bool Remove(std::string_view request_id);

    [[nodiscard]] bool Contains(std::string_view request_id) const;
    [[nodiscard]] size_t Size() const;

    /// Drops every slot; their waiters observe a broken promise.
    void Clear();

private:
    mutable std::shared_mutex lock_;
    std::unordered_map<std::string, std::promise<proto::nostr::Event>> pending_;
};
}
