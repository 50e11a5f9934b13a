#include "polyseq/trigger/axis_crossing.h"

#include "polyseq/core/math_utils.h"

#include <algorithm>
#include <cmath>

namespace polyseq {

bool isBasicCrossing(const Point2& prev, const Point2& curr) noexcept {
    return prev.x > 0.0 && curr.x <= 0.0 && curr.y > 0.0;
}

bool isLargeStepCrossing(const Point2& prev, const Point2& curr) noexcept {
    if (!(curr.y > 0.0)) return false;
    const double prevAngle = std::atan2(prev.x, prev.y);
    const double currAngle = std::atan2(curr.x, curr.y);
    return prevAngle > 0.0 && currAngle <= 0.0 && std::fabs(currAngle - prevAngle) < kPi;
}

bool isBoundaryCrossing(const Point2& prev, const Point2& curr) noexcept {
    return std::fabs(curr.x) < kAxisBoundaryEpsilon && curr.y > 0.0 && prev.x > 0.0;
}

double crossingFraction(const Point2& prev, const Point2& curr, CrossingCase crossing) noexcept {
    double fraction = 1.0;
    switch (crossing) {
    case CrossingCase::Basic: {
        const double span = prev.x - curr.x;
        if (span > 0.0) fraction = prev.x / span;
        break;
    }
    case CrossingCase::LargeStep: {
        const double prevAngle = std::atan2(prev.x, prev.y);
        const double span = std::fabs(prevAngle - std::atan2(curr.x, curr.y));
        if (span > 0.0) fraction = std::fabs(prevAngle) / span;
        break;
    }
    case CrossingCase::Boundary:
    case CrossingCase::None:
        break;
    }
    return std::clamp(fraction, 0.0, 1.0);
}

CrossingCase detectAxisCrossing(const Point2& prev, const Point2& curr) noexcept {
    if (isBasicCrossing(prev, curr)) return CrossingCase::Basic;
    if (isLargeStepCrossing(prev, curr)) return CrossingCase::LargeStep;
    if (isBoundaryCrossing(prev, curr)) return CrossingCase::Boundary;
    return CrossingCase::None;
}

} // namespace polyseq
