#include "polyseq/geometry/geometry_assembler.h"

#include "polyseq/core/logging.h"
#include "polyseq/core/math_utils.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace polyseq {

namespace {

struct OnSegmentHit {
    std::uint32_t vertex;
    double distanceFromStart;
};

// Strictly inside the segment and within tolerance of its supporting line.
bool liesOnSegment(const Point2& p, const Point2& a, const Point2& b, double& distanceFromStart) noexcept {
    const Point2 ab = sub(b, a);
    const double length = len(ab);
    if (length <= 0.0) return false;
    const Point2 ap = sub(p, a);
    const double lineDistance = std::fabs(cross(ab, ap)) / length;
    if (lineDistance > kPointOnSegmentTolerance * std::max(1.0, length)) return false;
    const double t = dot(ap, ab) / (length * length);
    if (t <= kIntersectionParamEpsilon || t >= 1.0 - kIntersectionParamEpsilon) return false;
    distanceFromStart = t * length;
    return true;
}

std::vector<IntersectionPoint> starCutPoints(const BaseShape& base, const IntersectionOptions& options) {
    IntersectionOptions cutOptions = options;
    cutOptions.mergeThreshold = kStarCutMergeThreshold;
    const IntersectionSolver solver(cutOptions);

    std::vector<IntersectionPoint> found = solver.findSelfIntersections(toSegments(base.points, base.segments));
    // Crossings that coincide with an outline vertex add nothing to the topology.
    found.erase(
        std::remove_if(found.begin(), found.end(), [&](const IntersectionPoint& ip) {
            for (const Point2& v : base.points) {
                if (distance(ip.point, v) < kStarCutMergeThreshold) return true;
            }
            return false;
        }),
        found.end());
    return found;
}

std::vector<IntersectionPoint> crossCopyPoints(
    const BaseShape& base,
    const ShapeSpec& spec,
    const IntersectionOptions& options,
    const CopyTransformer& transformer) {
    const std::vector<CopyTransform> transforms = transformer.transformsFor(spec);
    std::vector<std::vector<Segment2>> copies;
    copies.reserve(transforms.size());
    for (const CopyTransform& t : transforms) {
        std::vector<Point2> placed;
        placed.reserve(base.points.size());
        for (const Point2& p : base.points) placed.push_back(t.apply(p));
        copies.push_back(toSegments(placed, base.segments));
    }
    return IntersectionSolver(options).findCrossCopyIntersections(copies);
}

} // namespace

GeometryBuffer GeometryAssembler::assemble(
    const BaseShape& base,
    const std::vector<IntersectionPoint>& intersections,
    IntersectionFrame frame,
    bool routeSegments) {
    const std::size_t total = base.points.size() + intersections.size();
    if (total > kMaxGeometryVertices) {
        throw std::length_error("polyseq: vertex budget exceeded");
    }

    GeometryBuffer buffer;
    buffer.vertices = base.points;
    buffer.vertices.reserve(total);
    buffer.intersectionSources.reserve(intersections.size());
    for (const IntersectionPoint& ip : intersections) {
        buffer.vertices.push_back(ip.point);
        buffer.intersectionSources.push_back(ip.source);
    }

    buffer.meta.baseVertexCount = static_cast<std::uint32_t>(base.points.size());
    buffer.meta.intersectionVertexCount = static_cast<std::uint32_t>(intersections.size());
    buffer.meta.baseSegmentCount = static_cast<std::uint32_t>(base.segments.size());
    buffer.meta.intersectionFrame = intersections.empty() ? IntersectionFrame::None : frame;

    if (routeSegments && !intersections.empty()) {
        routeThroughIntersections(buffer, base.segments);
    } else {
        buffer.segments = base.segments;
    }
    return buffer;
}

void GeometryAssembler::routeThroughIntersections(GeometryBuffer& buffer, const std::vector<LineSegment>& baseSegments) {
    const std::uint32_t first = buffer.meta.baseVertexCount;
    const auto end = static_cast<std::uint32_t>(buffer.vertices.size());

    std::vector<OnSegmentHit> hits;
    for (const LineSegment& seg : baseSegments) {
        const Point2 a = buffer.vertices[seg.a];
        const Point2 b = buffer.vertices[seg.b];

        hits.clear();
        for (std::uint32_t v = first; v < end; ++v) {
            double d = 0.0;
            if (liesOnSegment(buffer.vertices[v], a, b, d)) {
                hits.push_back(OnSegmentHit{v, d});
            }
        }
        std::sort(hits.begin(), hits.end(), [](const OnSegmentHit& l, const OnSegmentHit& r) {
            return l.distanceFromStart < r.distanceFromStart;
        });

        if (buffer.segments.size() + hits.size() + 1 > kMaxGeometrySegments) {
            throw std::length_error("polyseq: segment budget exceeded");
        }
        std::uint32_t prev = seg.a;
        for (const OnSegmentHit& hit : hits) {
            buffer.segments.push_back(LineSegment{prev, hit.vertex});
            prev = hit.vertex;
        }
        buffer.segments.push_back(LineSegment{prev, seg.b});
    }
}

void GeometryAssembler::fillMetadata(GeometryBuffer& buffer, const ShapeSpec& spec) {
    buffer.meta.shapeFamily = spec.shapeFamily;
    buffer.meta.starSkip = isStarActive(spec) ? spec.starSkip : 1;
    buffer.meta.fractalLevel = effectiveFractalDivisions(spec);
}

std::shared_ptr<const GeometryBuffer> buildGeometry(
    const ShapeSpec& rawSpec,
    const IntersectionOptions& options,
    const CopyTransformer& transformer) {
    const ShapeSpec spec = sanitizeShapeSpec(rawSpec);
    const BaseShape base = ShapeBuilder::build(spec);

    GeometryBuffer buffer;
    if (crossCopyIntersectionsActive(spec)) {
        buffer = GeometryAssembler::assemble(
            base, crossCopyPoints(base, spec, options, transformer), IntersectionFrame::Layer, false);
    } else if (starCutsActive(spec)) {
        buffer = GeometryAssembler::assemble(base, starCutPoints(base, options), IntersectionFrame::Local, true);
    } else {
        buffer = GeometryAssembler::assemble(base, {}, IntersectionFrame::None, false);
    }
    GeometryAssembler::fillMetadata(buffer, spec);

    POLYSEQ_LOG_DEBUG("polyseq: built geometry (%u base, %u intersections, %zu segments)",
        buffer.meta.baseVertexCount, buffer.meta.intersectionVertexCount, buffer.segments.size());
    return std::make_shared<const GeometryBuffer>(std::move(buffer));
}

} // namespace polyseq
