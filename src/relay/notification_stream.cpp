#include "contextvm/relay/notification_stream.hpp"

namespace contextvm::relay {
    bool NotificationStream::Push(proto::nostr::Event event) {
        {
            std::lock_guard guard(lock_);
            if (closed_) {
                return false;
            }
            queue_.push_back(std::move(event));
        }
        available_.notify_one();
        return true;
    }

    bool NotificationStream::Next(proto::nostr::Event &out) {
        std::unique_lock guard(lock_);
        available_.wait(guard, [this] { return closed_ || !queue_.empty(); });
        if (queue_.empty()) {
            return false;
        }
        out = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    void NotificationStream::Close() {
        {
            std::lock_guard guard(lock_);
            closed_ = true;
        }
        available_.notify_all();
    }

    bool NotificationStream::IsClosed() const {
        std::lock_guard guard(lock_);
        return closed_;
    }

    size_t NotificationStream::Pending() const {
        std::lock_guard guard(lock_);
        return queue_.size();
    }
}
