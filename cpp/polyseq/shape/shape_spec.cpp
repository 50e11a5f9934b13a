#include "polyseq/shape/shape_spec.h"

#include <algorithm>
#include <cmath>

namespace polyseq {

namespace {

double finiteOr(double v, double fallback) noexcept {
    return std::isfinite(v) ? v : fallback;
}

bool differs(double a, double b, double threshold) noexcept {
    return std::fabs(a - b) >= threshold;
}

bool differsInt(std::int32_t a, std::int32_t b) noexcept {
    return differs(static_cast<double>(a), static_cast<double>(b), SpecSnapshot::kIntegerThreshold);
}

} // namespace

ShapeSpec sanitizeShapeSpec(const ShapeSpec& spec) noexcept {
    ShapeSpec out = spec;
    out.radius = finiteOr(out.radius, kDefaultRadius);
    if (!(out.radius > 0.0)) out.radius = 1.0;
    out.segmentCount = std::max<std::int32_t>(2, out.segmentCount);
    out.starSkip = std::max<std::int32_t>(1, out.starSkip);
    out.euclidPulses = std::clamp<std::int32_t>(out.euclidPulses, 0, out.segmentCount);
    out.fractalDivisions = std::max<std::int32_t>(1, out.fractalDivisions);
    out.copies = std::max<std::int32_t>(0, out.copies);
    out.stepScale = finiteOr(out.stepScale, kDefaultStepScale);
    out.angleDegrees = finiteOr(out.angleDegrees, 0.0);
    out.startingAngleDegrees = finiteOr(out.startingAngleDegrees, 0.0);
    out.modulusValue = std::max<std::int32_t>(1, out.modulusValue);
    out.altScale = finiteOr(out.altScale, 1.0);
    out.altStepN = std::max<std::int32_t>(1, out.altStepN);
    return out;
}

std::int32_t effectiveFractalDivisions(const ShapeSpec& spec) noexcept {
    if (spec.shapeFamily == ShapeFamily::Fractal || spec.useFractal) {
        return std::max<std::int32_t>(1, spec.fractalDivisions);
    }
    return 1;
}

bool isStarActive(const ShapeSpec& spec) noexcept {
    return spec.shapeFamily == ShapeFamily::Star && spec.starSkip > 1 && spec.starSkip < spec.segmentCount;
}

bool starCutsActive(const ShapeSpec& spec) noexcept {
    return isStarActive(spec) && spec.useCuts;
}

bool crossCopyIntersectionsActive(const ShapeSpec& spec) noexcept {
    return spec.useIntersections && spec.copies > 1;
}

void SpecSnapshot::capture(const ShapeSpec& spec) noexcept {
    spec_ = spec;
    hasValue_ = true;
}

bool SpecSnapshot::requiresRebuild(const ShapeSpec& next) const noexcept {
    if (!hasValue_) return true;
    const ShapeSpec& prev = spec_;

    if (prev.shapeFamily != next.shapeFamily) return true;
    if (prev.useCuts != next.useCuts) return true;
    if (prev.useFractal != next.useFractal) return true;
    if (prev.useIntersections != next.useIntersections) return true;
    if (differs(prev.radius, next.radius, kRadiusThreshold)) return true;
    if (differsInt(prev.segmentCount, next.segmentCount)) return true;
    if (differsInt(prev.starSkip, next.starSkip)) return true;
    if (differsInt(prev.euclidPulses, next.euclidPulses)) return true;
    if (differsInt(prev.fractalDivisions, next.fractalDivisions)) return true;

    // Cross-copy intersection points depend on every copy transform.
    if (crossCopyIntersectionsActive(prev) || crossCopyIntersectionsActive(next)) {
        if (transformsChanged(next)) return true;
    }
    return false;
}

bool SpecSnapshot::transformsChanged(const ShapeSpec& next) const noexcept {
    if (!hasValue_) return true;
    const ShapeSpec& prev = spec_;
    if (differsInt(prev.copies, next.copies)) return true;
    if (differs(prev.stepScale, next.stepScale, kScaleThreshold)) return true;
    if (differs(prev.angleDegrees, next.angleDegrees, kAngleThreshold)) return true;
    if (differs(prev.startingAngleDegrees, next.startingAngleDegrees, kAngleThreshold)) return true;
    if (prev.useModulus != next.useModulus) return true;
    if (differsInt(prev.modulusValue, next.modulusValue)) return true;
    if (prev.useAltScale != next.useAltScale) return true;
    if (differs(prev.altScale, next.altScale, kScaleThreshold)) return true;
    if (differsInt(prev.altStepN, next.altStepN)) return true;
    return false;
}

} // namespace polyseq
