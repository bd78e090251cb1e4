#include "poller/TickSchedule.hpp"

namespace jpoll {
    TickSchedule::clock::time_point TickSchedule::start(clock::time_point now) {
        deadline_ = now;
        skipped_ = 0;
        return deadline_;
    }

    TickSchedule::clock::time_point TickSchedule::next(clock::time_point now) {
        if (period_ <= clock::duration::zero()) {
            deadline_ = now;
            return deadline_;
        }

        deadline_ += period_;
        if (deadline_ >= now) return deadline_;

        // Overran: every grid point before now is dropped.
        const auto late = now - deadline_;
        const auto missed = static_cast<std::uint64_t>((late + period_ - clock::duration(1)) / period_);
        skipped_ += missed;
        deadline_ += period_ * static_cast<clock::duration::rep>(missed);
        return deadline_;
    }
} // namespace jpoll
