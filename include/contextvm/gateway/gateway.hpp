#pragma once
#include "contextvm/core/result.hpp"
#include "contextvm/core/failures.hpp"
#include "contextvm/core/constants.hpp"
#include "contextvm/transport/server_transport.hpp"
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
namespace contextvm::gateway {

/**
 * @brief Exposes a message handler as a server on the relay network
 *
 * Owns the server transport and the timer that sweeps idle sessions while
 * the inbound loop runs.
 */
class Gateway {
public:
    [[nodiscard]] static Result<std::unique_ptr<Gateway>, TransportFailure> Create(
        std::shared_ptr<interfaces::IRelayClient> relay_client,
        configuration::ServerTransportConfig config,
        std::chrono::milliseconds cleanup_interval = ProtocolConstants::DEFAULT_CLEANUP_INTERVAL);

    Gateway(std::unique_ptr<transport::ServerTransport> transport, std::chrono::milliseconds cleanup_interval);
    Gateway(const Gateway&) = delete;
    Gateway& operator=(const Gateway&) = delete;
    ~Gateway();

    [[nodiscard]] Result<std::string, TransportFailure> Announce();
    [[nodiscard]] Result<std::string, TransportFailure> PublishTools(const google::protobuf::ListValue& tools);

    /// Starts the session sweeper and runs the server loop on the calling
    /// thread. The sweeper stops when the loop returns.
    [[nodiscard]] Result<Unit, TransportFailure> Start();

    void Stop();

    [[nodiscard]] transport::ServerTransport& Transport() noexcept { return *transport_; }

private:
    void StartSweeper();
    void StopSweeper();
    void SweepLoop();

    std::unique_ptr<transport::ServerTransport> transport_;
    const std::chrono::milliseconds cleanup_interval_;

    std::mutex sweeper_lock_;
    std::condition_variable sweeper_wake_;
    bool sweeper_stop_ = false;
    std::thread sweeper_;
};
}
