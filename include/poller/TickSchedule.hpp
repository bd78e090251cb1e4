#pragma once

#include <chrono>
#include <cstdint>

namespace jpoll {
    /**
     * @brief Fixed-rate tick grid with skip-on-overrun.
     *
     * Ticks sit on the grid start + k * period. When a cycle finishes after one or more grid points
     * have already passed, those points are dropped (counted in skipped()) and the next deadline is
     * the first grid point not before "now". No catch-up burst is ever produced.
     *
     * A zero period degenerates to "tick again now".
     */
    class TickSchedule {
    public:
        using clock = std::chrono::steady_clock;

        explicit TickSchedule(clock::duration period) : period_(period) {
        }

        /// Anchor the grid; the first tick is due immediately.
        clock::time_point start(clock::time_point now);

        /// Deadline of the tick following the one whose cycle just completed at `now`.
        clock::time_point next(clock::time_point now);

        [[nodiscard]] clock::time_point deadline() const noexcept { return deadline_; }
        [[nodiscard]] clock::duration period() const noexcept { return period_; }
        [[nodiscard]] std::uint64_t skipped() const noexcept { return skipped_; }

    private:
        clock::duration period_;
        clock::time_point deadline_{};
        std::uint64_t skipped_{0};
    };
} // namespace jpoll
