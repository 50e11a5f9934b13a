#ifndef POLYSEQ_GEOMETRY_GEOMETRY_ASSEMBLER_H
#define POLYSEQ_GEOMETRY_GEOMETRY_ASSEMBLER_H

#include "polyseq/geometry/copy_transformer.h"
#include "polyseq/geometry/geometry_buffer.h"
#include "polyseq/geometry/intersection_solver.h"
#include "polyseq/shape/shape_builder.h"

#include <memory>
#include <vector>

namespace polyseq {

class GeometryAssembler {
public:
    // Base vertices keep their indices; intersections are appended after them.
    // With routeSegments set, every base segment is replaced by a chain through the
    // intersection points lying on it, ordered by distance from its start.
    static GeometryBuffer assemble(
        const BaseShape& base,
        const std::vector<IntersectionPoint>& intersections,
        IntersectionFrame frame,
        bool routeSegments);

    static void fillMetadata(GeometryBuffer& buffer, const ShapeSpec& spec);

private:
    static void routeThroughIntersections(GeometryBuffer& buffer, const std::vector<LineSegment>& baseSegments);
};

// ShapeBuilder -> IntersectionSolver (when enabled) -> GeometryAssembler.
// Throws std::length_error when a budget is exceeded; nothing is published in that case.
std::shared_ptr<const GeometryBuffer> buildGeometry(
    const ShapeSpec& spec,
    const IntersectionOptions& options,
    const CopyTransformer& transformer);

} // namespace polyseq

#endif // POLYSEQ_GEOMETRY_GEOMETRY_ASSEMBLER_H
