#ifndef POLYSEQ_GEOMETRY_COPY_TRANSFORMER_H
#define POLYSEQ_GEOMETRY_COPY_TRANSFORMER_H

#include "polyseq/core/types.h"
#include "polyseq/shape/shape_spec.h"

#include <cstdint>
#include <functional>
#include <vector>

namespace polyseq {

// Rotation is kept in degrees; convert with rotationRadians() where it is applied.
struct CopyTransform {
    std::uint32_t copyIndex{0};
    double scale{1.0};
    double rotationDegrees{0.0};

    double rotationRadians() const noexcept;
    Point2 apply(const Point2& local) const noexcept;
};

// Per-copy factor used when modulus scaling is enabled.
using ModulusScaleFn = std::function<double(std::uint32_t copyIndex, std::int32_t modulus)>;

// (copyIndex % m + 1) / m, cycling from 1/m up to 1. Moduli <= 1 give 1.
double modulusScaleFactor(std::uint32_t copyIndex, std::int32_t modulus) noexcept;

class CopyTransformer {
public:
    CopyTransformer();
    explicit CopyTransformer(ModulusScaleFn modulusScale);

    // One transform per copy; copies <= 0 yields an empty list.
    // Throws std::length_error above kMaxCopies.
    std::vector<CopyTransform> transformsFor(const ShapeSpec& spec) const;

    CopyTransform transformFor(const ShapeSpec& spec, std::uint32_t copyIndex) const;

private:
    ModulusScaleFn modulusScale_;
};

} // namespace polyseq

#endif // POLYSEQ_GEOMETRY_COPY_TRANSFORMER_H
