#include "time/clock.hpp"

#include <chrono>

Timestamp SystemClock::now() const noexcept {
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return Timestamp{static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count())};
}

const Clock& system_clock() noexcept {
    static const SystemClock clock;
    return clock;
}

void ManualClock::tick() noexcept {
    current_time_ += Timestamp{dt_};
}

void ManualClock::set(Timestamp now) noexcept {
    current_time_ = now;
}

Timestamp ManualClock::now() const noexcept {
    return current_time_;
}
