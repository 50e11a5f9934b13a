#ifndef POLYSEQ_TRIGGER_QUANTIZER_H
#define POLYSEQ_TRIGGER_QUANTIZER_H

#include "polyseq/core/types.h"

namespace polyseq {

struct QuantizeDecision {
    bool fireNow{true};
    double executeTimeSeconds{0.0};
    bool quantized{false};
};

// Grid alignment for trigger times.
class Quantizer {
public:
    Quantizer(double bpm, double gridTicks) noexcept : bpm_(bpm), gridTicks_(gridTicks) {}

    // Within the tolerance window of the nearest grid point: fire now, stamped with
    // the grid time. Otherwise schedule for that grid point, or the next one when
    // it already lies in the past.
    QuantizeDecision decide(double nowSeconds) const noexcept;

    double gridSeconds() const noexcept;

    // min(kQuantizeToleranceCeiling, 10% of one grid interval)
    double toleranceSeconds() const noexcept;

    double bpm() const noexcept { return bpm_; }
    double gridTicks() const noexcept { return gridTicks_; }

private:
    double bpm_;
    double gridTicks_;
};

} // namespace polyseq

#endif // POLYSEQ_TRIGGER_QUANTIZER_H
