#ifndef POLYSEQ_SHAPE_SHAPE_BUILDER_H
#define POLYSEQ_SHAPE_SHAPE_BUILDER_H

#include "polyseq/core/types.h"
#include "polyseq/shape/shape_spec.h"

#include <cstdint>
#include <vector>

namespace polyseq {

// Ordered vertex list plus the edges that connect it, in the shape's local frame.
struct BaseShape {
    std::vector<Point2> points;
    std::vector<LineSegment> segments;
};

// Generates the base outline for one shape family.
// All builders throw std::length_error when the result would exceed the geometry budgets.
class ShapeBuilder {
public:
    // Dispatches on the (sanitized) spec: Euclidean (with pulses), then star, then regular,
    // followed by fractal subdivision when requested.
    static BaseShape build(const ShapeSpec& spec);

    // n points on the circle starting at angle 0, connected cyclically.
    static BaseShape buildRegular(double radius, std::int32_t n);

    // {n/k}: vertex i connects to (i + k) mod n. gcd(n, k) > 1 yields
    // gcd(n, k) closed sub-paths, emitted one after another.
    static BaseShape buildStar(double radius, std::int32_t n, std::int32_t k);

    // Only the onset positions of euclideanRhythm(n, k), connected in angular order.
    static BaseShape buildEuclidean(double radius, std::int32_t n, std::int32_t k);

    // Splits every edge into `divisions` equal edges. Vertices are renumbered in
    // path order so each original vertex is followed by the points inserted after it.
    static BaseShape subdivide(const BaseShape& shape, std::int32_t divisions);

private:
    static std::vector<Point2> circlePoints(double radius, std::int32_t n);
};

} // namespace polyseq

#endif // POLYSEQ_SHAPE_SHAPE_BUILDER_H
