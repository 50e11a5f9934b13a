#ifndef POLYSEQ_ENGINE_CONFIG_H
#define POLYSEQ_ENGINE_CONFIG_H

#include "polyseq/core/types.h"
#include "polyseq/geometry/intersection_solver.h"

#include <string>

namespace polyseq {

// Runtime options shared by all layers.
struct EngineConfig {
    double bpm{kDefaultBpm};

    bool quantizationEnabled{false};
    std::string quantizationGrid{"1/4"};

    double overlapThreshold{kOverlapThreshold};

    // Re-arm every layer's trigger keys each time the rotation wraps.
    bool rearmPerRevolution{true};

    // 0 disables spec interpolation.
    double lerpTimeSeconds{0.0};

    IntersectionOptions intersections{};
};

} // namespace polyseq

#endif // POLYSEQ_ENGINE_CONFIG_H
