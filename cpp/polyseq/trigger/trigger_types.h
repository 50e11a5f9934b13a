#ifndef POLYSEQ_TRIGGER_TRIGGER_TYPES_H
#define POLYSEQ_TRIGGER_TRIGGER_TYPES_H

#include "polyseq/core/types.h"

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>

namespace polyseq {

// Identity of one crossing: (vertex, copy, layer) or (intersection, layer).
struct TriggerKey {
    static constexpr std::uint32_t kIntersectionCopy = 0xFFFFFFFFu;

    std::uint32_t layerId{0};
    std::uint32_t copyIndex{0};
    std::uint32_t vertexIndex{0};

    static TriggerKey vertex(std::uint32_t vertexIndex, std::uint32_t copyIndex, std::uint32_t layerId) noexcept {
        return TriggerKey{layerId, copyIndex, vertexIndex};
    }
    static TriggerKey intersection(std::uint32_t intersectionIndex, std::uint32_t layerId) noexcept {
        return TriggerKey{layerId, kIntersectionCopy, intersectionIndex};
    }

    bool isIntersection() const noexcept { return copyIndex == kIntersectionCopy; }

    bool operator==(const TriggerKey& other) const noexcept {
        return layerId == other.layerId && copyIndex == other.copyIndex && vertexIndex == other.vertexIndex;
    }
    bool operator!=(const TriggerKey& other) const noexcept { return !(*this == other); }
};

struct TriggerKeyHash {
    std::size_t operator()(const TriggerKey& k) const noexcept {
        std::uint64_t h = 1469598103934665603ull;
        for (const std::uint32_t v : {k.layerId, k.copyIndex, k.vertexIndex}) {
            h ^= v;
            h *= 1099511628211ull;
        }
        return static_cast<std::size_t>(h);
    }
};

// Everything known about a crossing before note resolution.
struct TriggerData {
    Point2 position{0.0, 0.0};      // world position at the current rotation
    Point2 localPosition{0.0, 0.0}; // copy-transformed, unrotated by the layer
    std::uint32_t layerId{0};
    std::uint32_t copyIndex{0};
    std::uint32_t vertexIndex{0};
    bool isIntersection{false};
    std::uint32_t intersectionIndex{0};
    std::uint64_t globalIndex{0};
    double angle{0.0};     // layer rotation, radians
    double lastAngle{0.0};
};

struct ResolvedNote {
    double frequency{0.0};
    double duration{0.0};
    double velocity{0.0};
    double pan{0.0};
    std::uint64_t pointIndex{0};
    std::string noteName; // empty unless equal temperament is enabled
};

// What the dispatch callback receives. Each call gets its own copy.
struct FiredTrigger {
    TriggerData source;
    ResolvedNote note;
    double timeSeconds{0.0};
    bool quantized{false};
};

struct PendingTrigger {
    FiredTrigger snapshot;
    double executeTimeSeconds{0.0};
    std::uint32_t layerId{0};
    bool quantized{true};
    std::uint64_t sequence{0}; // insertion order, breaks ties between equal times
};

enum class TriggerEventType : std::uint16_t {
    Overflow = 1,
    TriggerFired = 2,
};

enum class TriggerEventFlags : std::uint16_t {
    Quantized = 1 << 0,
    Intersection = 1 << 1,
    FromPending = 1 << 2,
};

// Fixed-size record for the polled event stream.
struct TriggerEvent {
    std::uint16_t type;
    std::uint16_t flags;
    std::uint32_t layerId;
    std::uint32_t globalIndex;
    std::uint32_t copyIndex;
    std::uint32_t vertexIndex;
    float x;
    float y;
    float frequency;
    float duration;
    float velocity;
    double timeSeconds;
};

struct TickStats {
    std::uint32_t crossingsDetected{0};
    std::uint32_t triggersFired{0};
    std::uint32_t triggersSuppressed{0};
    std::uint32_t triggersScheduled{0};
    std::uint32_t pendingFlushed{0};
    std::uint32_t callbackFailures{0}; // resolver and dispatch exceptions
    std::uint32_t resolverFailures{0};
    std::uint32_t rebuilds{0};
    std::uint32_t rebuildFailures{0};
    std::uint32_t pendingCount{0};
    std::uint32_t markerCount{0};
    double rotationDegrees{0.0};
    bool wrapped{false};
};

} // namespace polyseq

#endif // POLYSEQ_TRIGGER_TRIGGER_TYPES_H
