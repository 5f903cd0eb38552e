#pragma once
#include "nostr/event.pb.h"
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
namespace contextvm::relay {

/// Inbound event queue of one subscription. Producers are relay fan-out
/// threads; the single consumer is the transport loop.
class NotificationStream {
public:
    NotificationStream() = default;
    NotificationStream(const NotificationStream&) = delete;
    NotificationStream& operator=(const NotificationStream&) = delete;

    /// Returns false once the stream is closed; the event is discarded.
    bool Push(proto::nostr::Event event);

    /// Blocks until an event is available. Returns false when the stream is
    /// closed and drained.
    bool Next(proto::nostr::Event& out);

    void Close();

    [[nodiscard]] bool IsClosed() const;
    [[nodiscard]] size_t Pending() const;

private:
    mutable std::mutex lock_;
    std::condition_variable available_;
    std::deque<proto::nostr::Event> queue_;
    bool closed_ = false;
};
}
