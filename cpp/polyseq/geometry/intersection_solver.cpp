#include "polyseq/geometry/intersection_solver.h"

#include "polyseq/core/math_utils.h"

#include <cmath>
#include <stdexcept>

namespace polyseq {

namespace {

bool sharesEndpoint(const Segment2& a, const Segment2& b) noexcept {
    const auto as = pointKey(a.start);
    const auto ae = pointKey(a.end);
    const auto bs = pointKey(b.start);
    const auto be = pointKey(b.end);
    return as == bs || as == be || ae == bs || ae == be;
}

} // namespace

std::vector<Segment2> toSegments(const std::vector<Point2>& points, const std::vector<LineSegment>& segments) {
    std::vector<Segment2> out;
    out.reserve(segments.size());
    for (const LineSegment& s : segments) {
        if (s.a >= points.size() || s.b >= points.size()) {
            throw std::out_of_range("polyseq: segment index outside vertex list");
        }
        out.push_back(Segment2{points[s.a], points[s.b]});
    }
    return out;
}

std::optional<Point2> IntersectionSolver::intersect(const Segment2& a, const Segment2& b) const noexcept {
    const double x1 = a.start.x, y1 = a.start.y;
    const double x2 = a.end.x, y2 = a.end.y;
    const double x3 = b.start.x, y3 = b.start.y;
    const double x4 = b.end.x, y4 = b.end.y;

    const double denom = (y4 - y3) * (x2 - x1) - (x4 - x3) * (y2 - y1);
    if (std::fabs(denom) < kParallelDeterminantEpsilon) return std::nullopt;

    const double ua = ((x4 - x3) * (y1 - y3) - (y4 - y3) * (x1 - x3)) / denom;
    const double ub = ((x2 - x1) * (y1 - y3) - (y2 - y1) * (x1 - x3)) / denom;

    const double eps = options_.paramEpsilon;
    if (ua < -eps || ua > 1.0 + eps || ub < -eps || ub > 1.0 + eps) return std::nullopt;

    return Point2{x1 + ua * (x2 - x1), y1 + ua * (y2 - y1)};
}

bool IntersectionSolver::accept(std::vector<IntersectionPoint>& accepted, const IntersectionPoint& candidate) const {
    for (const IntersectionPoint& existing : accepted) {
        if (distance(existing.point, candidate.point) < options_.mergeThreshold) return false;
    }
    if (accepted.size() >= kMaxGeometryVertices) {
        throw std::length_error("polyseq: intersection budget exceeded");
    }
    accepted.push_back(candidate);
    return true;
}

void IntersectionSolver::scanPair(
    const std::vector<Segment2>& a,
    std::uint32_t copyA,
    const std::vector<Segment2>& b,
    std::uint32_t copyB,
    std::vector<IntersectionPoint>& accepted) const {
    for (std::size_t i = 0; i < a.size(); ++i) {
        for (std::size_t j = 0; j < b.size(); ++j) {
            const std::optional<Point2> hit = intersect(a[i], b[j]);
            if (!hit) continue;
            accept(accepted, IntersectionPoint{
                *hit,
                IntersectionProvenance{copyA, static_cast<std::uint32_t>(i), copyB, static_cast<std::uint32_t>(j)}});
        }
    }
}

void IntersectionSolver::scanSelf(
    const std::vector<Segment2>& segments,
    std::uint32_t copy,
    std::vector<IntersectionPoint>& accepted) const {
    for (std::size_t i = 0; i < segments.size(); ++i) {
        for (std::size_t j = i + 1; j < segments.size(); ++j) {
            if (sharesEndpoint(segments[i], segments[j])) continue;
            const std::optional<Point2> hit = intersect(segments[i], segments[j]);
            if (!hit) continue;
            accept(accepted, IntersectionPoint{
                *hit,
                IntersectionProvenance{copy, static_cast<std::uint32_t>(i), copy, static_cast<std::uint32_t>(j)}});
        }
    }
}

std::vector<IntersectionPoint> IntersectionSolver::findIntersections(
    const std::vector<Segment2>& a,
    const std::vector<Segment2>& b) const {
    std::vector<IntersectionPoint> accepted;
    scanPair(a, 0, b, 1, accepted);
    return accepted;
}

std::vector<IntersectionPoint> IntersectionSolver::findSelfIntersections(const std::vector<Segment2>& segments) const {
    std::vector<IntersectionPoint> accepted;
    scanSelf(segments, 0, accepted);
    return accepted;
}

std::vector<IntersectionPoint> IntersectionSolver::findCrossCopyIntersections(
    const std::vector<std::vector<Segment2>>& copies) const {
    std::vector<IntersectionPoint> accepted;
    if (copies.size() <= 1) return accepted;

    for (std::size_t i = 0; i < copies.size(); ++i) {
        for (std::size_t j = i + 1; j < copies.size(); ++j) {
            scanPair(copies[i], static_cast<std::uint32_t>(i), copies[j], static_cast<std::uint32_t>(j), accepted);
        }
    }
    for (std::size_t i = 0; i < copies.size(); ++i) {
        scanSelf(copies[i], static_cast<std::uint32_t>(i), accepted);
    }
    return accepted;
}

} // namespace polyseq
