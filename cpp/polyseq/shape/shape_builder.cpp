#include "polyseq/shape/shape_builder.h"

#include "polyseq/core/math_utils.h"
#include "polyseq/shape/euclidean_rhythm.h"

#include <cmath>
#include <limits>
#include <stdexcept>

namespace polyseq {

namespace {

void ensureVertexBudget(std::int64_t count) {
    if (count < 0 || static_cast<std::uint64_t>(count) > kMaxGeometryVertices) {
        throw std::length_error("polyseq: vertex budget exceeded");
    }
}

void ensureSegmentBudget(std::int64_t count) {
    if (count < 0 || static_cast<std::uint64_t>(count) > kMaxGeometrySegments) {
        throw std::length_error("polyseq: segment budget exceeded");
    }
}

void appendCycle(std::vector<LineSegment>& segments, std::uint32_t count) {
    if (count < 2) return;
    for (std::uint32_t i = 0; i < count; ++i) {
        segments.push_back(LineSegment{i, (i + 1) % count});
    }
}

} // namespace

std::vector<Point2> ShapeBuilder::circlePoints(double radius, std::int32_t n) {
    ensureVertexBudget(n);
    std::vector<Point2> points;
    points.reserve(static_cast<std::size_t>(n));
    for (std::int32_t i = 0; i < n; ++i) {
        const double angle = (static_cast<double>(i) / static_cast<double>(n)) * kTwoPi;
        points.push_back(Point2{std::cos(angle) * radius, std::sin(angle) * radius});
    }
    return points;
}

BaseShape ShapeBuilder::buildRegular(double radius, std::int32_t n) {
    BaseShape shape;
    if (n <= 0) return shape;
    shape.points = circlePoints(radius, n);
    shape.segments.reserve(static_cast<std::size_t>(n));
    appendCycle(shape.segments, static_cast<std::uint32_t>(n));
    return shape;
}

BaseShape ShapeBuilder::buildStar(double radius, std::int32_t n, std::int32_t k) {
    if (k <= 1 || k >= n) return buildRegular(radius, n);

    BaseShape shape;
    shape.points = circlePoints(radius, n);

    const std::int64_t g = gcd(n, k);
    const std::int64_t pathLength = n / g;
    shape.segments.reserve(static_cast<std::size_t>(n));
    for (std::int64_t start = 0; start < g; ++start) {
        std::int64_t v = start;
        for (std::int64_t j = 0; j < pathLength; ++j) {
            const std::int64_t next = (v + k) % n;
            shape.segments.push_back(LineSegment{
                static_cast<std::uint32_t>(v),
                static_cast<std::uint32_t>(next)});
            v = next;
        }
    }
    return shape;
}

BaseShape ShapeBuilder::buildEuclidean(double radius, std::int32_t n, std::int32_t k) {
    BaseShape shape;
    if (n <= 0) return shape;
    const std::vector<Point2> all = circlePoints(radius, n);
    const std::vector<bool> pattern = euclideanRhythm(n, k);
    for (std::size_t i = 0; i < pattern.size(); ++i) {
        if (pattern[i]) shape.points.push_back(all[i]);
    }
    appendCycle(shape.segments, static_cast<std::uint32_t>(shape.points.size()));
    return shape;
}

BaseShape ShapeBuilder::subdivide(const BaseShape& shape, std::int32_t divisions) {
    if (divisions <= 1 || shape.segments.empty()) return shape;

    const std::int64_t edgeCount = static_cast<std::int64_t>(shape.segments.size());
    ensureSegmentBudget(edgeCount * divisions);
    ensureVertexBudget(static_cast<std::int64_t>(shape.points.size()) + edgeCount * (divisions - 1));

    constexpr std::uint32_t kUnmapped = std::numeric_limits<std::uint32_t>::max();
    std::vector<std::uint32_t> remap(shape.points.size(), kUnmapped);

    BaseShape out;
    out.points.reserve(shape.points.size() + static_cast<std::size_t>(edgeCount * (divisions - 1)));
    out.segments.reserve(static_cast<std::size_t>(edgeCount * divisions));

    auto mapVertex = [&](std::uint32_t index) {
        if (remap[index] == kUnmapped) {
            remap[index] = static_cast<std::uint32_t>(out.points.size());
            out.points.push_back(shape.points[index]);
        }
        return remap[index];
    };

    for (const LineSegment& seg : shape.segments) {
        const Point2 start = shape.points[seg.a];
        const Point2 end = shape.points[seg.b];
        std::uint32_t prev = mapVertex(seg.a);
        for (std::int32_t j = 1; j < divisions; ++j) {
            const double t = static_cast<double>(j) / static_cast<double>(divisions);
            const auto mid = static_cast<std::uint32_t>(out.points.size());
            out.points.push_back(Point2{
                start.x + (end.x - start.x) * t,
                start.y + (end.y - start.y) * t});
            out.segments.push_back(LineSegment{prev, mid});
            prev = mid;
        }
        out.segments.push_back(LineSegment{prev, mapVertex(seg.b)});
    }

    // Isolated vertices (no incident edge) keep their place at the end.
    for (std::uint32_t i = 0; i < remap.size(); ++i) {
        mapVertex(i);
    }
    return out;
}

BaseShape ShapeBuilder::build(const ShapeSpec& rawSpec) {
    const ShapeSpec spec = sanitizeShapeSpec(rawSpec);

    BaseShape shape;
    // Zero pulses leaves nothing to keep; the full polygon stands in.
    if (spec.shapeFamily == ShapeFamily::Euclidean && spec.euclidPulses > 0) {
        shape = buildEuclidean(spec.radius, spec.segmentCount, spec.euclidPulses);
    } else if (isStarActive(spec)) {
        shape = buildStar(spec.radius, spec.segmentCount, spec.starSkip);
    } else {
        shape = buildRegular(spec.radius, spec.segmentCount);
    }
    return subdivide(shape, effectiveFractalDivisions(spec));
}

} // namespace polyseq
