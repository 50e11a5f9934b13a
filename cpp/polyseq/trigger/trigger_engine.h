#ifndef POLYSEQ_TRIGGER_TRIGGER_ENGINE_H
#define POLYSEQ_TRIGGER_TRIGGER_ENGINE_H

#include "polyseq/geometry/copy_transformer.h"
#include "polyseq/geometry/geometry_buffer.h"
#include "polyseq/notes/note_resolver.h"
#include "polyseq/trigger/engine_observer.h"
#include "polyseq/trigger/pending_queue.h"
#include "polyseq/trigger/quantizer.h"
#include "polyseq/trigger/sequence_counter.h"
#include "polyseq/trigger/trigger_types.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <unordered_set>
#include <vector>

namespace polyseq {

// Collaborators shared by every layer for one detection pass.
struct TriggerContext {
    const NoteResolver* resolver{nullptr};
    EngineObserver* observer{nullptr};
    SequenceCounter* sequence{nullptr};
    const Quantizer* quantizer{nullptr}; // null: fire immediately
    double overlapThreshold{kOverlapThreshold};
    std::function<void(const FiredTrigger&)> fire;
};

struct DetectionFrame {
    const GeometryBuffer* geometry{nullptr};
    const std::vector<CopyTransform>* transforms{nullptr};
    const ShapeSpec* spec{nullptr};
    double previousAngle{0.0}; // radians
    double currentAngle{0.0};
    double nowSeconds{0.0};
    double frameSeconds{0.0}; // time covered by previousAngle -> currentAngle
};

// Exactly-once crossing detection for one layer.
//
// A key moves Armed -> Fired, or Armed -> Pending -> Fired when quantized. It is
// marked seen on the first crossing whether it fired, was scheduled, or was
// suppressed by overlap, and stays seen until rearm() or reset().
class TriggerEngine {
public:
    explicit TriggerEngine(std::uint32_t layerId) noexcept : layerId_(layerId) {}

    void detect(const DetectionFrame& frame, const TriggerContext& ctx, TickStats& stats);

    // Moves due pending triggers into `out` (time-ordered within this layer).
    std::size_t collectDue(double nowSeconds, double toleranceSeconds, std::vector<PendingTrigger>& out);

    // Clears the seen-set only; scheduled triggers still fire.
    void rearm() noexcept { seen_.clear(); }

    // Clears the seen-set and drops every pending trigger.
    void reset() noexcept;

    bool hasFired(const TriggerKey& key) const { return seen_.find(key) != seen_.end(); }
    std::size_t seenCount() const noexcept { return seen_.size(); }
    std::size_t pendingCount() const noexcept { return pending_.size(); }
    const PendingQueue& pending() const noexcept { return pending_; }
    std::uint32_t layerId() const noexcept { return layerId_; }

private:
    struct Candidate {
        TriggerKey key;
        Point2 previous;
        Point2 current;
        double timeSeconds{0.0};
        TriggerData data;
    };

    void process(Candidate& candidate, const DetectionFrame& frame, const TriggerContext& ctx, TickStats& stats);
    bool overlapsThisFrame(const Point2& position, double threshold) const noexcept;
    void deliver(FiredTrigger& trigger, double crossingSeconds, const TriggerContext& ctx, TickStats& stats);

    std::uint32_t layerId_;
    std::unordered_set<TriggerKey, TriggerKeyHash> seen_;
    PendingQueue pending_;
    std::vector<Point2> triggeredThisFrame_;
};

} // namespace polyseq

#endif // POLYSEQ_TRIGGER_TRIGGER_ENGINE_H
