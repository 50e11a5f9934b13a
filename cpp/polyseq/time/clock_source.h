#ifndef POLYSEQ_TIME_CLOCK_SOURCE_H
#define POLYSEQ_TIME_CLOCK_SOURCE_H

#include "polyseq/core/util.h"

namespace polyseq {

class ClockSource {
public:
    virtual ~ClockSource() = default;
    virtual double nowSeconds() const = 0;
};

// Monotonic wall clock (performance.now() under Emscripten).
class SteadyClockSource final : public ClockSource {
public:
    double nowSeconds() const override { return emscripten_get_now() / 1000.0; }
};

// Host-driven clock, advanced explicitly. Used to make ticks deterministic.
class ManualClockSource final : public ClockSource {
public:
    double nowSeconds() const override { return now_; }
    void set(double seconds) noexcept { now_ = seconds; }
    void advance(double seconds) noexcept { now_ += seconds; }

private:
    double now_{0.0};
};

} // namespace polyseq

#endif // POLYSEQ_TIME_CLOCK_SOURCE_H
