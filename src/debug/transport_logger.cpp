#include "contextvm/debug/transport_logger.hpp"

#include <atomic>
#include <cstdio>
#include <mutex>
#include <string>

namespace contextvm::debug {
    namespace {
        std::atomic<LogLevel> &Threshold() {
            static std::atomic<LogLevel> threshold{LogLevel::Info};
            return threshold;
        }

        std::mutex &SinkMutex() {
            static std::mutex sink_mutex;
            return sink_mutex;
        }

        LogSink &CustomSink() {
            static LogSink sink;
            return sink;
        }

        void WriteToStderr(const LogLevel level, const std::string_view component, const std::string_view message) {
            std::fprintf(stderr, "[CVM-%s] %.*s: %.*s\n",
                         LevelToString(level),
                         static_cast<int>(component.size()), component.data(),
                         static_cast<int>(message.size()), message.data());
        }
    }

    void SetLogLevel(const LogLevel level) noexcept {
        Threshold().store(level, std::memory_order_relaxed);
    }

    LogLevel GetLogLevel() noexcept {
        return Threshold().load(std::memory_order_relaxed);
    }

    bool IsEnabled(const LogLevel level) noexcept {
        const LogLevel threshold = GetLogLevel();
        return threshold != LogLevel::Off && level >= threshold;
    }

    void SetLogSink(LogSink sink) {
        std::lock_guard lock(SinkMutex());
        CustomSink() = std::move(sink);
    }

    void Write(const LogLevel level, const std::string_view component, const std::string_view message) {
        std::lock_guard lock(SinkMutex());
        if (const auto &sink = CustomSink(); sink) {
            sink(level, component, message);
            return;
        }
        WriteToStderr(level, component, message);
    }

    const char *LevelToString(const LogLevel level) noexcept {
        switch (level) {
            case LogLevel::Debug: return "DEBUG";
            case LogLevel::Info: return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error: return "ERROR";
            case LogLevel::Off: return "OFF";
        }
        return "UNKNOWN";
    }
}
