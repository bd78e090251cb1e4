#pragma once

#include <atomic>
#include <functional>
#include <string_view>

namespace jpoll {
    enum class LogLevel : int { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

    inline const char *to_string(LogLevel l) {
        switch (l) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO: return "INFO";
            case LogLevel::WARN: return "WARN";
            case LogLevel::ERROR: return "ERROR";
            default: return "UNKNOWN";
        }
    }

    /// Injectable log sink. Components tag their own messages, e.g. "[HTTPCLIENT] ...".
    using LogFn = std::function<void(LogLevel, std::string_view)>;

    namespace log {
        inline std::atomic<int> min_level{static_cast<int>(LogLevel::INFO)}; // master filter for stderr_sink

        inline void set_min_level(LogLevel l) noexcept {
            min_level.store(static_cast<int>(l), std::memory_order_relaxed);
        }

        inline bool enabled(LogLevel l) noexcept {
            return static_cast<int>(l) >= min_level.load(std::memory_order_relaxed);
        }

        /// Default sink: one "[LEVEL] message" line per call on std::cerr, lines never interleave.
        void stderr_sink(LogLevel level, std::string_view msg);

        /// Sink that drops everything (tests, quiet callers).
        inline LogFn null_sink() {
            return [](LogLevel, std::string_view) {};
        }
    }
} // namespace jpoll
