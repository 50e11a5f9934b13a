#ifndef POLYSEQ_GEOMETRY_INTERSECTION_SOLVER_H
#define POLYSEQ_GEOMETRY_INTERSECTION_SOLVER_H

#include "polyseq/core/types.h"
#include "polyseq/geometry/geometry_buffer.h"

#include <cstdint>
#include <optional>
#include <vector>

namespace polyseq {

struct Segment2 {
    Point2 start;
    Point2 end;
};

struct IntersectionOptions {
    double mergeThreshold{kIntersectionMergeThreshold};
    double paramEpsilon{kIntersectionParamEpsilon};
};

// Resolves index pairs against a vertex list.
std::vector<Segment2> toSegments(const std::vector<Point2>& points, const std::vector<LineSegment>& segments);

class IntersectionSolver {
public:
    IntersectionSolver() = default;
    explicit IntersectionSolver(const IntersectionOptions& options) : options_(options) {}

    const IntersectionOptions& options() const noexcept { return options_; }

    // Parametric intersection; nullopt for parallel or degenerate segments and
    // for parameters outside [-eps, 1 + eps].
    std::optional<Point2> intersect(const Segment2& a, const Segment2& b) const noexcept;

    // Every segment of `a` against every segment of `b`, deduplicated.
    std::vector<IntersectionPoint> findIntersections(
        const std::vector<Segment2>& a,
        const std::vector<Segment2>& b) const;

    // Pairs sharing an endpoint (adjacent or wrap-adjacent along a path) are skipped.
    std::vector<IntersectionPoint> findSelfIntersections(const std::vector<Segment2>& segments) const;

    // Copy i against copy j for i < j, plus the self-intersections of each copy.
    // Fewer than two copies yields nothing.
    std::vector<IntersectionPoint> findCrossCopyIntersections(
        const std::vector<std::vector<Segment2>>& copies) const;

    // Appends `candidate` unless it lies within the merge threshold of an accepted point.
    bool accept(std::vector<IntersectionPoint>& accepted, const IntersectionPoint& candidate) const;

private:
    void scanPair(
        const std::vector<Segment2>& a,
        std::uint32_t copyA,
        const std::vector<Segment2>& b,
        std::uint32_t copyB,
        std::vector<IntersectionPoint>& accepted) const;

    void scanSelf(
        const std::vector<Segment2>& segments,
        std::uint32_t copy,
        std::vector<IntersectionPoint>& accepted) const;

    IntersectionOptions options_{};
};

} // namespace polyseq

#endif // POLYSEQ_GEOMETRY_INTERSECTION_SOLVER_H
