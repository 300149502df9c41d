#pragma once

#include <atomic>

namespace spex {

// Monotonic seconds. Every cooldown, retention window and timeout reads time
// through this so tests can drive it by hand.
class Clock {
public:
    virtual ~Clock() = default;
    virtual double now() const = 0;
};

class SteadyClock : public Clock {
public:
    double now() const override;
};

class ManualClock : public Clock {
public:
    explicit ManualClock(double start = 0.0) : now_(start) {}

    double now() const override { return now_.load(); }
    void set(double t) { now_.store(t); }
    void advance(double dt) { now_.store(now_.load() + dt); }

private:
    std::atomic<double> now_;
};

}  // namespace spex
