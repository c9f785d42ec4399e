#pragma once

/**
 * @file pipeline_logger.hpp
 * @brief Tagged log lines for the session pipeline.
 *
 * Lines look like `[LUCID] INFO  orchestrator: session 3f2a... sealed`.
 * Session ids are logged in hex. Keys, nonces derived from them and
 * plaintext must never be passed to these macros.
 *
 * The minimum level is process-wide and defaults to Info; build with
 * -DLUCID_DEFAULT_LOG_LEVEL=0 to start at Debug. Tests can capture
 * output with SetLogSink().
 */

#include <fmt/core.h>

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>

#ifndef LUCID_DEFAULT_LOG_LEVEL
#define LUCID_DEFAULT_LOG_LEVEL 1
#endif

namespace lucid::debug {

enum class LogLevel : uint8_t {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Off = 4
};

using LogSink = std::function<void(LogLevel, std::string_view component, std::string_view message)>;

namespace detail {
    inline std::atomic<LogLevel>& MinimumLevel() {
        static std::atomic<LogLevel> level{static_cast<LogLevel>(LUCID_DEFAULT_LOG_LEVEL)};
        return level;
    }

    struct SinkSlot {
        std::mutex lock;
        LogSink sink;
    };

    inline SinkSlot& Sink() {
        static SinkSlot slot;
        return slot;
    }
}

inline const char* LevelToString(const LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO ";
        case LogLevel::Warn: return "WARN ";
        case LogLevel::Error: return "ERROR";
        default: return "OFF  ";
    }
}

inline void SetLogLevel(const LogLevel level) {
    detail::MinimumLevel().store(level, std::memory_order_relaxed);
}

inline LogLevel GetLogLevel() {
    return detail::MinimumLevel().load(std::memory_order_relaxed);
}

inline bool IsEnabled(const LogLevel level) {
    return level != LogLevel::Off && level >= GetLogLevel();
}

/// Replaces stderr output with @p sink; an empty function restores stderr.
inline void SetLogSink(LogSink sink) {
    auto& slot = detail::Sink();
    std::lock_guard guard(slot.lock);
    slot.sink = std::move(sink);
}

/// The sink runs outside the slot lock, so it may log or swap sinks itself.
inline void Emit(const LogLevel level, const std::string_view component, const std::string& message) {
    LogSink sink;
    {
        auto& slot = detail::Sink();
        std::lock_guard guard(slot.lock);
        sink = slot.sink;
    }
    if (sink) {
        sink(level, component, message);
        return;
    }
    std::fprintf(stderr, "[LUCID] %s %.*s: %s\n",
                 LevelToString(level),
                 static_cast<int>(component.size()), component.data(),
                 message.c_str());
    std::fflush(stderr);
}

}

#define LUCID_LOG(level, component, ...) \
    do { \
        if (::lucid::debug::IsEnabled(level)) { \
            ::lucid::debug::Emit(level, component, fmt::format(__VA_ARGS__)); \
        } \
    } while(0)

#define LUCID_LOG_DEBUG(component, ...) LUCID_LOG(::lucid::debug::LogLevel::Debug, component, __VA_ARGS__)
#define LUCID_LOG_INFO(component, ...) LUCID_LOG(::lucid::debug::LogLevel::Info, component, __VA_ARGS__)
#define LUCID_LOG_WARN(component, ...) LUCID_LOG(::lucid::debug::LogLevel::Warn, component, __VA_ARGS__)
#define LUCID_LOG_ERROR(component, ...) LUCID_LOG(::lucid::debug::LogLevel::Error, component, __VA_ARGS__)
