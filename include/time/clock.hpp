#pragma once
#include "utils/types.hpp"

// Source of wall-clock timestamps for WAL entries, order submission times and
// snapshots. Matching never reads a clock.
class Clock {
public:
    virtual ~Clock() = default;
    [[nodiscard]] virtual Timestamp now() const noexcept = 0;
};

class SystemClock final : public Clock {
public:
    [[nodiscard]] Timestamp now() const noexcept override;
};

// Process-wide SystemClock used when no clock is injected.
[[nodiscard]] const Clock& system_clock() noexcept;

// Deterministic clock for tests: starts at `start` and advances by `dt` per tick.
class ManualClock final : public Clock {
public:
    explicit ManualClock(Timestamp start = Timestamp{0}, std::uint64_t dt = 1)
        : dt_(dt), current_time_(start) {}

    void tick() noexcept;
    void set(Timestamp now) noexcept;
    [[nodiscard]] Timestamp now() const noexcept override;

    ManualClock(const ManualClock&) = delete;
    void operator=(const ManualClock&) = delete;

private:
    std::uint64_t dt_{1}; // time delta per tick
    Timestamp current_time_{0};
};
