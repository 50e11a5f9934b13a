#ifndef POLYSEQ_CORE_TYPES_H
#define POLYSEQ_CORE_TYPES_H

#include <cstdint>
#include <cstddef>

// Lightweight types and constants shared by every polyseq subsystem.

namespace polyseq {

// Musical time
static constexpr double kTicksPerBeat = 480.0;
static constexpr double kTicksPerMeasure = 1920.0; // 4/4

// Geometry tolerances (world units unless noted)
static constexpr double kIntersectionMergeThreshold = 5.0;
static constexpr double kStarCutMergeThreshold = 0.001;
static constexpr double kIntersectionParamEpsilon = 1e-5;
static constexpr double kParallelDeterminantEpsilon = 1e-10;
static constexpr double kPointKeyPrecision = 1e-6;
static constexpr double kPointOnSegmentTolerance = 1e-6;

// Geometry budgets; exceeding them aborts a rebuild
static constexpr std::size_t kMaxGeometryVertices = 1u << 20;
static constexpr std::size_t kMaxGeometrySegments = 1u << 21;
static constexpr std::size_t kMaxCopies = 1u << 12;

// Trigger detection
static constexpr double kOverlapThreshold = 20.0;
static constexpr double kAxisBoundaryEpsilon = 1e-6;
static constexpr double kPendingFlushTolerance = 0.002;   // seconds
static constexpr double kQuantizeToleranceCeiling = 0.03; // seconds
static constexpr double kQuantizeToleranceGridFraction = 0.1;
static constexpr std::uint32_t kMarkerLifeFrames = 30;

// Frame pacing
static constexpr double kMaxFrameDeltaSeconds = 0.1;

// Event stream
static constexpr std::size_t kMaxEvents = 2048;

// Spec defaults
static constexpr double kDefaultRadius = 432.0;
static constexpr std::int32_t kDefaultSegments = 4;
static constexpr std::int32_t kDefaultCopies = 1;
static constexpr double kDefaultStepScale = 1.0;
static constexpr double kDefaultAngleDegrees = 15.0;
static constexpr std::int32_t kDefaultModulus = 4;
static constexpr double kDefaultBpm = 120.0;

struct Point2 {
    double x;
    double y;
};

// Edge between two entries of a shared vertex list.
struct LineSegment {
    std::uint32_t a;
    std::uint32_t b;
};

} // namespace polyseq

enum class PolyseqError : std::uint32_t {
    Ok = 0,
    InvalidLayer = 1,
    RebuildFailed = 2,
    ResolverFailed = 3,
    DispatchFailed = 4,
    EventOverflow = 5,
    InvalidArgument = 6,
};

#endif // POLYSEQ_CORE_TYPES_H
