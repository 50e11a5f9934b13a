#include "polyseq/trigger/trigger_engine.h"

#include "polyseq/core/logging.h"
#include "polyseq/core/math_utils.h"
#include "polyseq/trigger/axis_crossing.h"

#include <exception>
#include <utility>

namespace polyseq {

void TriggerEngine::reset() noexcept {
    seen_.clear();
    pending_.clear();
    triggeredThisFrame_.clear();
}

std::size_t TriggerEngine::collectDue(double nowSeconds, double toleranceSeconds, std::vector<PendingTrigger>& out) {
    return pending_.collectDue(nowSeconds, toleranceSeconds, out);
}

bool TriggerEngine::overlapsThisFrame(const Point2& position, double threshold) const noexcept {
    for (const Point2& p : triggeredThisFrame_) {
        if (distance(p, position) < threshold) return true;
    }
    return false;
}

void TriggerEngine::detect(const DetectionFrame& frame, const TriggerContext& ctx, TickStats& stats) {
    triggeredThisFrame_.clear();
    if (!frame.geometry || !frame.transforms || !frame.spec) return;

    const GeometryBuffer& geometry = *frame.geometry;
    const std::uint32_t baseCount = geometry.meta.baseVertexCount;
    const auto vertexCount = static_cast<std::uint32_t>(geometry.vertices.size());

    // Star cuts live in the shape-local frame and repeat with every copy.
    const std::uint32_t perCopyCount =
        geometry.meta.intersectionFrame == IntersectionFrame::Local ? vertexCount : baseCount;

    for (const CopyTransform& transform : *frame.transforms) {
        for (std::uint32_t vi = 0; vi < perCopyCount; ++vi) {
            const Point2 local = transform.apply(geometry.vertices[vi]);

            Candidate c;
            c.key = TriggerKey::vertex(vi, transform.copyIndex, layerId_);
            c.previous = rotate(local, frame.previousAngle);
            c.current = rotate(local, frame.currentAngle);
            c.data.localPosition = local;
            c.data.copyIndex = transform.copyIndex;
            c.data.vertexIndex = vi;
            c.data.isIntersection = vi >= baseCount;
            c.data.intersectionIndex = vi >= baseCount ? vi - baseCount : 0;
            process(c, frame, ctx, stats);
        }
    }

    if (geometry.meta.intersectionFrame == IntersectionFrame::Layer && !frame.transforms->empty()) {
        for (std::uint32_t vi = baseCount; vi < vertexCount; ++vi) {
            const Point2 local = geometry.vertices[vi];
            const std::uint32_t ii = vi - baseCount;

            Candidate c;
            c.key = TriggerKey::intersection(ii, layerId_);
            c.previous = rotate(local, frame.previousAngle);
            c.current = rotate(local, frame.currentAngle);
            c.data.localPosition = local;
            c.data.copyIndex = 0;
            c.data.vertexIndex = vi;
            c.data.isIntersection = true;
            c.data.intersectionIndex = ii;
            process(c, frame, ctx, stats);
        }
    }
}

void TriggerEngine::process(Candidate& c, const DetectionFrame& frame, const TriggerContext& ctx, TickStats& stats) {
    if (hasFired(c.key)) return;
    const CrossingCase crossing = detectAxisCrossing(c.previous, c.current);
    if (crossing == CrossingCase::None) return;

    // Back-dated to the interpolated instant the point reached the axis.
    const double fraction = crossingFraction(c.previous, c.current, crossing);
    c.timeSeconds = frame.nowSeconds - (1.0 - fraction) * frame.frameSeconds;

    ++stats.crossingsDetected;
    seen_.insert(c.key);

    if (overlapsThisFrame(c.current, ctx.overlapThreshold)) {
        ++stats.triggersSuppressed;
        if (ctx.observer) ctx.observer->onTriggerSuppressed(c.key, c.current);
        return;
    }
    triggeredThisFrame_.push_back(c.current);

    c.data.position = c.current;
    c.data.layerId = layerId_;
    c.data.angle = frame.currentAngle;
    c.data.lastAngle = frame.previousAngle;
    c.data.globalIndex = ctx.sequence ? ctx.sequence->next() : 0;

    FiredTrigger trigger;
    trigger.source = c.data;
    if (ctx.resolver) {
        try {
            trigger.note = ctx.resolver->resolve(c.data, *frame.spec);
        } catch (const std::exception& e) {
            ++stats.callbackFailures;
            ++stats.resolverFailures;
            POLYSEQ_LOG_WARN("polyseq: note resolver failed on layer %u: %s", layerId_, e.what());
            if (ctx.observer) ctx.observer->onCallbackError(PolyseqError::ResolverFailed, e.what());
            return;
        }
    }
    deliver(trigger, c.timeSeconds, ctx, stats);
}

void TriggerEngine::deliver(FiredTrigger& trigger, double crossingSeconds, const TriggerContext& ctx, TickStats& stats) {
    if (!ctx.quantizer) {
        trigger.timeSeconds = crossingSeconds;
        trigger.quantized = false;
        if (ctx.fire) ctx.fire(trigger);
        return;
    }

    const QuantizeDecision decision = ctx.quantizer->decide(crossingSeconds);
    trigger.timeSeconds = decision.executeTimeSeconds;
    trigger.quantized = decision.quantized;
    if (decision.fireNow) {
        if (ctx.fire) ctx.fire(trigger);
        return;
    }

    PendingTrigger pending;
    pending.snapshot = trigger;
    pending.executeTimeSeconds = decision.executeTimeSeconds;
    pending.layerId = layerId_;
    pending.quantized = decision.quantized;
    pending.sequence = trigger.source.globalIndex;
    ++stats.triggersScheduled;
    POLYSEQ_LOG_DEBUG("polyseq: layer %u scheduled trigger %llu for %.4f s (crossed %.4f s)",
        layerId_, static_cast<unsigned long long>(pending.sequence), pending.executeTimeSeconds, crossingSeconds);
    if (ctx.observer) ctx.observer->onTriggerScheduled(pending);
    pending_.push(std::move(pending));
}

} // namespace polyseq
