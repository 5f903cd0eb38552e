#pragma once

/**
 * @file transport_logger.hpp
 * @brief Diagnostic logging for the transport layer.
 *
 * Messages below the runtime threshold are discarded before formatting.
 * Debug-level tracing (event contents, correlation ids) is compiled in only
 * when CVM_DEBUG_TRACE is defined, since it prints message payloads.
 *
 * Enable via CMake: -DCVM_DEBUG_TRACE=ON
 */

#include "contextvm/core/format.hpp"

#include <cstdint>
#include <functional>
#include <string_view>

namespace contextvm::debug {

enum class LogLevel : uint8_t {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3,
    Off = 4
};

using LogSink = std::function<void(LogLevel level, std::string_view component, std::string_view message)>;

void SetLogLevel(LogLevel level) noexcept;

[[nodiscard]] LogLevel GetLogLevel() noexcept;

[[nodiscard]] bool IsEnabled(LogLevel level) noexcept;

/**
 * @brief Replaces the output sink. Passing an empty function restores the
 * default stderr sink.
 */
void SetLogSink(LogSink sink);

void Write(LogLevel level, std::string_view component, std::string_view message);

[[nodiscard]] const char* LevelToString(LogLevel level) noexcept;

}

// ============================================================================
// Logging macros
// ============================================================================

#define CVM_LOG_AT(level, component, ...) \
    do { \
        if (::contextvm::debug::IsEnabled(level)) { \
            ::contextvm::debug::Write(level, component, ::contextvm::compat::format(__VA_ARGS__)); \
        } \
    } while (0)

#define CVM_LOG_INFO(component, ...) CVM_LOG_AT(::contextvm::debug::LogLevel::Info, component, __VA_ARGS__)
#define CVM_LOG_WARN(component, ...) CVM_LOG_AT(::contextvm::debug::LogLevel::Warning, component, __VA_ARGS__)
#define CVM_LOG_ERROR(component, ...) CVM_LOG_AT(::contextvm::debug::LogLevel::Error, component, __VA_ARGS__)

#ifdef CVM_DEBUG_TRACE
#define CVM_LOG_DEBUG(component, ...) CVM_LOG_AT(::contextvm::debug::LogLevel::Debug, component, __VA_ARGS__)
#else
#define CVM_LOG_DEBUG(component, ...) do { } while (0)
#endif
