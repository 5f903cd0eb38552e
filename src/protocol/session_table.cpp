#include "contextvm/protocol/session_table.hpp"
#include "contextvm/core/format.hpp"
#include <mutex>

namespace contextvm::protocol {
    SessionTouch SessionTable::Touch(
        const std::string_view client_pubkey,
        const bool is_encrypted,
        const Clock::time_point now) {
        std::unique_lock guard(lock_);
        auto [it, created] = sessions_.try_emplace(std::string(client_pubkey));
        ClientSession &session = it->second;
        if (created) {
            session.client_pubkey = it->first;
        }
        session.is_encrypted = is_encrypted;
        session.last_activity = now;
        return SessionTouch{.session = session, .created = created};
    }

    bool SessionTable::MarkInitialized(const std::string_view client_pubkey) {
        std::unique_lock guard(lock_);
        const auto it = sessions_.find(std::string(client_pubkey));
        if (it == sessions_.end()) {
            return false;
        }
        it->second.is_initialized = true;
        return true;
    }

    Result<ClientSession, TransportFailure> SessionTable::Find(const std::string_view client_pubkey) const {
        std::shared_lock guard(lock_);
        const auto it = sessions_.find(std::string(client_pubkey));
        if (it == sessions_.end()) {
            return Result<ClientSession, TransportFailure>::Err(
                TransportFailure::SessionNotFound(compat::format("No session for {}", client_pubkey)));
        }
        return Result<ClientSession, TransportFailure>::Ok(it->second);
    }

    size_t SessionTable::CleanupInactive(const std::chrono::milliseconds timeout, const Clock::time_point now) {
        std::unique_lock guard(lock_);
        return std::erase_if(sessions_, [&](const auto &entry) {
            return now - entry.second.last_activity > timeout;
        });
    }

    size_t SessionTable::Size() const {
        std::shared_lock guard(lock_);
        return sessions_.size();
    }

    std::vector<std::string> SessionTable::ClientKeys() const {
        std::shared_lock guard(lock_);
        std::vector<std::string> keys;
        keys.reserve(sessions_.size());
        for (const auto &[key, session]: sessions_) {
            keys.push_back(key);
        }
        return keys;
    }
}
