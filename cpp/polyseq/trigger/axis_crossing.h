#ifndef POLYSEQ_TRIGGER_AXIS_CROSSING_H
#define POLYSEQ_TRIGGER_AXIS_CROSSING_H

#include "polyseq/core/types.h"

#include <cstdint>

namespace polyseq {

enum class CrossingCase : std::uint8_t {
    None = 0,
    Basic = 1,     // x went from positive to non-positive above the origin
    LargeStep = 2, // atan2(x, y) changed sign by less than pi
    Boundary = 3,  // landed within epsilon of the axis coming from the right
};

// Crossing of the reference axis (x = 0, y > 0) between two frames.
// The cases are evaluated in order; the first match is reported.
CrossingCase detectAxisCrossing(const Point2& prev, const Point2& curr) noexcept;

// Fraction of the frame, in [0, 1], at which the point reached the axis.
// Basic crossings interpolate x linearly; large steps interpolate the angle.
double crossingFraction(const Point2& prev, const Point2& curr, CrossingCase crossing) noexcept;

bool isBasicCrossing(const Point2& prev, const Point2& curr) noexcept;
bool isLargeStepCrossing(const Point2& prev, const Point2& curr) noexcept;
bool isBoundaryCrossing(const Point2& prev, const Point2& curr) noexcept;

} // namespace polyseq

#endif // POLYSEQ_TRIGGER_AXIS_CROSSING_H
