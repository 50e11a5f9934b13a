#include "polyseq/geometry/copy_transformer.h"

#include "polyseq/core/math_utils.h"

#include <cmath>
#include <stdexcept>
#include <utility>

namespace polyseq {

double CopyTransform::rotationRadians() const noexcept {
    return degToRad(rotationDegrees);
}

Point2 CopyTransform::apply(const Point2& local) const noexcept {
    return rotate(mul(local, scale), rotationRadians());
}

double modulusScaleFactor(std::uint32_t copyIndex, std::int32_t modulus) noexcept {
    if (modulus <= 1) return 1.0;
    const auto m = static_cast<std::uint32_t>(modulus);
    return static_cast<double>(copyIndex % m + 1) / static_cast<double>(m);
}

CopyTransformer::CopyTransformer() : modulusScale_(&modulusScaleFactor) {}

CopyTransformer::CopyTransformer(ModulusScaleFn modulusScale)
    : modulusScale_(modulusScale ? std::move(modulusScale) : ModulusScaleFn(&modulusScaleFactor)) {}

CopyTransform CopyTransformer::transformFor(const ShapeSpec& spec, std::uint32_t copyIndex) const {
    CopyTransform t;
    t.copyIndex = copyIndex;
    t.scale = std::pow(spec.stepScale, static_cast<double>(copyIndex));
    if (spec.useModulus) {
        t.scale *= modulusScale_(copyIndex, spec.modulusValue);
    } else if (spec.useAltScale && spec.altStepN > 0 && (copyIndex + 1) % static_cast<std::uint32_t>(spec.altStepN) == 0) {
        t.scale *= spec.altScale;
    }
    t.rotationDegrees = spec.startingAngleDegrees + static_cast<double>(copyIndex) * spec.angleDegrees;
    return t;
}

std::vector<CopyTransform> CopyTransformer::transformsFor(const ShapeSpec& spec) const {
    std::vector<CopyTransform> out;
    if (spec.copies <= 0) return out;
    if (static_cast<std::size_t>(spec.copies) > kMaxCopies) {
        throw std::length_error("polyseq: copy budget exceeded");
    }
    out.reserve(static_cast<std::size_t>(spec.copies));
    for (std::int32_t i = 0; i < spec.copies; ++i) {
        out.push_back(transformFor(spec, static_cast<std::uint32_t>(i)));
    }
    return out;
}

} // namespace polyseq
