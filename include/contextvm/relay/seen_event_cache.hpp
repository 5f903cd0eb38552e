#pragma once
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_set>
namespace contextvm::relay {

/**
 * @brief Bounded record of recently delivered event ids
 *
 * Holds at most `capacity` ids. Once full, recording a new id forgets the
 * oldest one, so a duplicate arriving after `capacity` newer events is
 * accepted again.
 */
class SeenEventCache {
public:
    explicit SeenEventCache(size_t capacity);

    SeenEventCache(const SeenEventCache&) = delete;
    SeenEventCache& operator=(const SeenEventCache&) = delete;

    /// Returns false when @p event_id is already recorded.
    [[nodiscard]] bool Record(std::string_view event_id);

    [[nodiscard]] bool Contains(std::string_view event_id) const;
    [[nodiscard]] size_t Size() const;
    [[nodiscard]] size_t Capacity() const noexcept { return capacity_; }

private:
    const size_t capacity_;
    mutable std::mutex lock_;
    std::unordered_set<std::string> ids_;
    std::deque<std::string> order_;
};
}
