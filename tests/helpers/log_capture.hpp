#pragma once
#include "contextvm/debug/transport_logger.hpp"
#include <algorithm>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace contextvm::test_helpers {

using debug::LogLevel;

struct CapturedLine {
    LogLevel level;
    std::string component;
    std::string message;
};

/// Routes transport logging into memory for the lifetime of the object.
class LogCapture {
public:
    explicit LogCapture(const LogLevel threshold = LogLevel::Debug)
        : previous_level_(debug::GetLogLevel()) {
        debug::SetLogLevel(threshold);
        debug::SetLogSink([this](const LogLevel level, const std::string_view component,
                                 const std::string_view message) {
            std::lock_guard lock(mutex_);
            lines_.push_back(CapturedLine{level, std::string(component), std::string(message)});
        });
    }

    ~LogCapture() {
        debug::SetLogSink({});
        debug::SetLogLevel(previous_level_);
    }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    [[nodiscard]] size_t Count(const LogLevel level, const std::string_view needle = {}) const {
        std::lock_guard lock(mutex_);
        return static_cast<size_t>(std::count_if(lines_.begin(), lines_.end(), [&](const CapturedLine& line) {
            return line.level == level && line.message.find(needle) != std::string::npos;
        }));
    }

    [[nodiscard]] bool Contains(const LogLevel level, const std::string_view needle) const {
        return Count(level, needle) > 0;
    }

    [[nodiscard]] std::vector<CapturedLine> Lines() const {
        std::lock_guard lock(mutex_);
        return lines_;
    }

private:
    LogLevel previous_level_;
    mutable std::mutex mutex_;
    std::vector<CapturedLine> lines_;
};

}
