// PolyseqEngine per-frame pipeline

#include "polyseq/engine.h"
#include "polyseq/internal/engine_state.h"

#include "polyseq/core/logging.h"
#include "polyseq/core/util.h"
#include "polyseq/trigger/pending_queue.h"
#include "polyseq/trigger/trigger_engine.h"

#include <algorithm>
#include <exception>

polyseq::TickStats PolyseqEngine::tick(double dtSeconds) {
    return tick(dtSeconds, state_->clock->nowSeconds());
}

polyseq::TickStats PolyseqEngine::tick(double dtSeconds, double nowSeconds) {
    const double t0 = emscripten_get_now();
    clearError();

    polyseq::TickStats stats;
    rebuildLayers(dtSeconds, stats);

    polyseq::RotationClock& rotation = state_->rotation;
    stats.wrapped = rotation.advance(dtSeconds, state_->config.bpm);
    if (stats.wrapped && state_->config.rearmPerRevolution) {
        rearmAllLayers();
    }

    detectTriggers(rotation.previousUnwrappedRadians(), rotation.angleRadians(), nowSeconds, rotation.lastStepSeconds(), stats);
    flushPending(nowSeconds, stats);
    state_->markers.age();

    std::uint32_t pending = 0;
    state_->layers.forEach([&](const polyseq::Layer& layer) {
        pending += static_cast<std::uint32_t>(layer.triggers().pendingCount());
    });
    stats.pendingCount = pending;
    stats.markerCount = static_cast<std::uint32_t>(state_->markers.size());
    stats.rotationDegrees = rotation.angleDegrees();

    state_->lastTick = stats;
    state_->lastTickMs = static_cast<float>(emscripten_get_now() - t0);
    return stats;
}

void PolyseqEngine::rebuildLayers(double dtSeconds, polyseq::TickStats& stats) {
    const polyseq::EngineConfig& config = state_->config;
    state_->layers.forEach([&](polyseq::Layer& layer) {
        layer.advanceLerp(dtSeconds, config.lerpTimeSeconds);
        const polyseq::RebuildResult result = layer.rebuildIfDirty(config.intersections, state_->transformer);
        if (result.error != PolyseqError::Ok) {
            ++stats.rebuildFailures;
            setError(result.error);
            state_->observer->onRebuildFailed(layer.id(), result.message.c_str());
            return;
        }
        if (result.geometryChanged) {
            ++stats.rebuilds;
            state_->generation++;
        }
    });
}

void PolyseqEngine::detectTriggers(double previousAngle, double currentAngle, double nowSeconds, double frameSeconds, polyseq::TickStats& stats) {
    polyseq::TriggerContext ctx;
    ctx.resolver = state_->resolver.get();
    ctx.observer = state_->observer.get();
    ctx.sequence = &state_->sequence;
    ctx.quantizer = state_->quantizer.get();
    ctx.overlapThreshold = state_->config.overlapThreshold;
    ctx.fire = [this, &stats](const polyseq::FiredTrigger& trigger) {
        fireTrigger(trigger, false, stats);
    };

    const std::uint32_t resolverFailuresBefore = stats.resolverFailures;
    state_->layers.forEach([&](polyseq::Layer& layer) {
        if (!layer.visible() || !layer.isMaterialized()) return;

        polyseq::DetectionFrame frame;
        frame.geometry = layer.geometry().get();
        frame.transforms = &layer.transforms();
        frame.spec = &layer.currentSpec();
        frame.previousAngle = previousAngle;
        frame.currentAngle = currentAngle;
        frame.nowSeconds = nowSeconds;
        frame.frameSeconds = frameSeconds;
        layer.triggers().detect(frame, ctx, stats);
    });
    if (stats.resolverFailures != resolverFailuresBefore) {
        setError(PolyseqError::ResolverFailed);
    }
}

void PolyseqEngine::flushPending(double nowSeconds, polyseq::TickStats& stats) {
    std::vector<polyseq::PendingTrigger>& due = state_->dueScratch;
    due.clear();
    state_->layers.forEach([&](polyseq::Layer& layer) {
        layer.triggers().collectDue(nowSeconds, polyseq::kPendingFlushTolerance, due);
    });
    if (due.empty()) return;

    // Each layer's entries are already ordered; merge them by time.
    std::stable_sort(due.begin(), due.end(), polyseq::pendingBefore);
    for (const polyseq::PendingTrigger& pending : due) {
        polyseq::FiredTrigger trigger = pending.snapshot;
        trigger.timeSeconds = pending.executeTimeSeconds;
        trigger.quantized = pending.quantized;
        fireTrigger(trigger, true, stats);
    }
    due.clear();
}

void PolyseqEngine::fireTrigger(const polyseq::FiredTrigger& trigger, bool fromPending, polyseq::TickStats& stats) {
    // The sink gets its own copy; nothing it keeps aliases engine state.
    const polyseq::FiredTrigger delivered = trigger;

    if (state_->sink) {
        try {
            state_->sink->dispatch(delivered);
        } catch (const std::exception& e) {
            ++stats.callbackFailures;
            setError(PolyseqError::DispatchFailed);
            POLYSEQ_LOG_WARN("polyseq: trigger dispatch failed on layer %u: %s", delivered.source.layerId, e.what());
            state_->observer->onCallbackError(PolyseqError::DispatchFailed, e.what());
        }
    }

    ++stats.triggersFired;
    if (fromPending) ++stats.pendingFlushed;
    recordTriggerFired(delivered, fromPending);
    state_->markers.add(delivered);
    state_->observer->onTriggerFired(delivered);
}
