#ifndef POLYSEQ_GEOMETRY_GEOMETRY_BUFFER_H
#define POLYSEQ_GEOMETRY_GEOMETRY_BUFFER_H

#include "polyseq/core/types.h"
#include "polyseq/shape/shape_spec.h"

#include <cstdint>
#include <vector>

namespace polyseq {

// Frame the intersection vertices are expressed in.
enum class IntersectionFrame : std::uint8_t {
    None = 0,
    Local = 1, // shape-local, drawn with every copy transform (star cuts)
    Layer = 2, // already copy-transformed, drawn with the layer rotation only
};

// Which pair of segments produced an intersection vertex.
struct IntersectionProvenance {
    std::uint32_t copyA;
    std::uint32_t segmentA;
    std::uint32_t copyB;
    std::uint32_t segmentB;
};

struct IntersectionPoint {
    Point2 point;
    IntersectionProvenance source;
};

struct GeometryMetadata {
    std::uint32_t baseVertexCount{0};
    std::uint32_t intersectionVertexCount{0};
    std::uint32_t baseSegmentCount{0};
    ShapeFamily shapeFamily{ShapeFamily::Regular};
    std::int32_t starSkip{1};
    std::int32_t fractalLevel{1};
    IntersectionFrame intersectionFrame{IntersectionFrame::None};
};

// Immutable once published: a rebuild produces a new buffer instead of editing this one.
// vertices = [base vertices..., intersection vertices...]; every segment index < vertices.size().
struct GeometryBuffer {
    std::vector<Point2> vertices;
    std::vector<LineSegment> segments;
    std::vector<IntersectionProvenance> intersectionSources;
    GeometryMetadata meta;

    bool isBaseVertex(std::uint32_t index) const noexcept { return index < meta.baseVertexCount; }
    bool empty() const noexcept { return vertices.empty(); }
};

} // namespace polyseq

#endif // POLYSEQ_GEOMETRY_GEOMETRY_BUFFER_H
