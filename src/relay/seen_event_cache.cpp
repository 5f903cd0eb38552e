#include "contextvm/relay/seen_event_cache.hpp"
#include <algorithm>

namespace contextvm::relay {
    SeenEventCache::SeenEventCache(const size_t capacity)
        : capacity_(std::max<size_t>(capacity, 1)) {
    }

    bool SeenEventCache::Record(const std::string_view event_id) {
        std::lock_guard guard(lock_);
        std::string id(event_id);
        if (!ids_.insert(id).second) {
            return false;
        }
        order_.push_back(std::move(id));
        while (order_.size() > capacity_) {
            ids_.erase(order_.front());
            order_.pop_front();
        }
        return true;
    }

    bool SeenEventCache::Contains(const std::string_view event_id) const {
        std::lock_guard guard(lock_);
        return ids_.contains(std::string(event_id));
    }

    size_t SeenEventCache::Size() const {
        std::lock_guard guard(lock_);
        return ids_.size();
    }
}
