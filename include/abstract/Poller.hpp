#pragma once

#include <cstdint>

namespace jpoll {
    /**
     * @brief Return code for lifecycle operations.
     *
     *  - OK    : accepted (the loop is now scheduled on the io_context) or completed.
     *  - ERROR : precondition failed (e.g. already started / not running).
     *
     * Per-fetch failures are reported through FetchError and logs, not through this enum.
     */
    enum class Status {
        OK,
        ERROR
    };

    inline const char *to_string(Status s) {
        switch (s) {
            case Status::OK: return "OK";
            case Status::ERROR: return "ERROR";
            default: return "UNKNOWN";
        }
    }

    /// Lightweight counters snapshot.
    struct PollStats {
        std::uint64_t ticks{0};              ///< fetch-and-dispatch cycles started
        std::uint64_t fetch_ok{0};
        std::uint64_t fetch_failed{0};
        std::uint64_t ticks_skipped{0};      ///< grid points dropped because a cycle overran
        std::uint64_t handler_exceptions{0};
    };

    /**
     * @brief Type-erased lifecycle of a poller, independent of its payload type.
     *
     * Lifecycle (single strand):
     *   1) start(...) : typed, see JsonPoller<T>. Schedules the first tick immediately.
     *   2) stop()     : cancel timer + in-flight request. Idempotent and safe at any time.
     */
    struct IPoller {
        virtual ~IPoller() = default;

        /// Returns ERROR if the poller was not running.
        virtual Status stop() = 0;

        [[nodiscard]] virtual bool is_running() const = 0;

        [[nodiscard]] virtual PollStats stats() const = 0;
    };
} // namespace jpoll
