#pragma once
#include "contextvm/core/result.hpp"
#include "contextvm/core/failures.hpp"
#include <chrono>
#include <cstddef>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
namespace contextvm::protocol {
struct ClientSession {
    std::string client_pubkey;
    bool is_initialized = false;
    bool is_encrypted = false;
    std::chrono::steady_clock::time_point last_activity;
};
struct SessionTouch {
    ClientSession session;
    bool created = false;
};
class SessionTable {
public:
    using Clock = std::chrono::steady_clock;

    SessionTable() = default;
    SessionTable(const SessionTable&) = delete;
    SessionTable& operator=(const SessionTable&) = delete;
    SessionTable(SessionTable&&) = delete;
    SessionTable& operator=(SessionTable&&) = delete;
    ~SessionTable() = default;

    /// Get-or-create the session of @p client_pubkey, refresh its activity
    /// timestamp and record the encryption state of the message just seen.
    SessionTouch Touch(std::string_view client_pubkey, bool is_encrypted, Clock::time_point now = Clock::now());

    /// Returns false when the session does not exist.
    bool MarkInitialized(std::string_view client_pubkey);

    [[nodiscard]] Result<ClientSession, TransportFailure> Find(std::string_view client_pubkey) const;

    /// Removes every session idle for longer than @p timeout.
    size_t CleanupInactive(std::chrono::milliseconds timeout, Clock::time_point now = Clock::now());

    [[nodiscard]] size_t Size() const;
    [[nodiscard]] std::vector<std::string> ClientKeys() const;

private:
    mutable std::shared_mutex lock_;
    std::unordered_map<std::string, ClientSession> sessions_;
};
}
