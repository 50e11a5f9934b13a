#include "polyseq/trigger/quantizer.h"

#include "polyseq/time/musical_time.h"

#include <algorithm>
#include <cmath>

namespace polyseq {

double Quantizer::gridSeconds() const noexcept {
    return ticksToSeconds(gridTicks_, bpm_);
}

double Quantizer::toleranceSeconds() const noexcept {
    return std::min(kQuantizeToleranceCeiling, gridSeconds() * kQuantizeToleranceGridFraction);
}

QuantizeDecision Quantizer::decide(double nowSeconds) const noexcept {
    if (gridTicks_ <= 0.0 || bpm_ <= 0.0) {
        return QuantizeDecision{true, nowSeconds, false};
    }

    const double ticks = secondsToTicks(nowSeconds, bpm_);
    const double quantizedTicks = quantizeToGrid(ticks, gridTicks_);
    const double quantizedTime = ticksToSeconds(quantizedTicks, bpm_);

    if (std::fabs(quantizedTime - nowSeconds) < toleranceSeconds()) {
        return QuantizeDecision{true, quantizedTime, true};
    }
    if (quantizedTime > nowSeconds) {
        return QuantizeDecision{false, quantizedTime, true};
    }
    return QuantizeDecision{false, ticksToSeconds(quantizedTicks + gridTicks_, bpm_), true};
}

} // namespace polyseq
