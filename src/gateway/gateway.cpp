#include "contextvm/gateway/gateway.hpp"
#include "contextvm/debug/transport_logger.hpp"

namespace contextvm::gateway {
    namespace {
        constexpr std::string_view LOG_COMPONENT = "Gateway";
    }

    Result<std::unique_ptr<Gateway>, TransportFailure> Gateway::Create(
        std::shared_ptr<interfaces::IRelayClient> relay_client,
        configuration::ServerTransportConfig config,
        const std::chrono::milliseconds cleanup_interval) {
        using ResultType = Result<std::unique_ptr<Gateway>, TransportFailure>;
        if (cleanup_interval.count() <= 0) {
            return ResultType::Err(TransportFailure::Other("cleanup_interval must be positive"));
        }
        auto transport = transport::ServerTransport::Create(std::move(relay_client), std::move(config));
        CVM_TRY_ERR(ResultType, transport);
        return ResultType::Ok(std::make_unique<Gateway>(std::move(transport).Unwrap(), cleanup_interval));
    }

    Gateway::Gateway(std::unique_ptr<transport::ServerTransport> transport,
                     const std::chrono::milliseconds cleanup_interval)
        : transport_(std::move(transport))
          , cleanup_interval_(cleanup_interval) {
    }

    Gateway::~Gateway() {
        Stop();
    }

    Result<std::string, TransportFailure> Gateway::Announce() {
        return transport_->Announce();
    }

    Result<std::string, TransportFailure> Gateway::PublishTools(const google::protobuf::ListValue &tools) {
        return transport_->PublishTools(tools);
    }

    Result<Unit, TransportFailure> Gateway::Start() {
        StartSweeper();
        auto result = transport_->Start();
        StopSweeper();
        return result;
    }

    void Gateway::Stop() {
        transport_->Stop();
        StopSweeper();
    }

    void Gateway::StartSweeper() {
        std::lock_guard guard(sweeper_lock_);
        if (sweeper_.joinable()) {
            return;
        }
        sweeper_stop_ = false;
        sweeper_ = std::thread(&Gateway::SweepLoop, this);
    }

    void Gateway::StopSweeper() {
        std::thread worker;
        {
            std::lock_guard guard(sweeper_lock_);
            sweeper_stop_ = true;
            worker = std::move(sweeper_);
        }
        sweeper_wake_.notify_all();
        if (worker.joinable()) {
            worker.join();
        }
    }

    void Gateway::SweepLoop() {
        CVM_LOG_DEBUG(LOG_COMPONENT, "Session sweeper running every {} ms", cleanup_interval_.count());
        std::unique_lock guard(sweeper_lock_);
        while (!sweeper_wake_.wait_for(guard, cleanup_interval_, [this] { return sweeper_stop_; })) {
            guard.unlock();
            transport_->CleanupInactiveSessions();
            guard.lock();
        }
    }
}
