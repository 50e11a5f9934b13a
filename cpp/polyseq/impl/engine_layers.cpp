// PolyseqEngine layer, configuration and collaborator methods

#include "polyseq/engine.h"
#include "polyseq/internal/engine_state.h"

#include "polyseq/core/logging.h"
#include "polyseq/time/musical_time.h"

#include <utility>

std::uint32_t PolyseqEngine::createLayer(const polyseq::ShapeSpec& spec) {
    clearError();
    polyseq::Layer& layer = state_->layers.create(spec);

    // A new layer is usable before the first tick.
    layer.advanceLerp(0.0, 0.0);
    const polyseq::RebuildResult result = layer.rebuildIfDirty(state_->config.intersections, state_->transformer);
    if (result.error != PolyseqError::Ok) {
        setError(result.error);
        state_->observer->onRebuildFailed(layer.id(), result.message.c_str());
    }
    state_->generation++;
    return layer.id();
}

bool PolyseqEngine::deleteLayer(std::uint32_t layerId) {
    clearError();
    if (!state_->layers.remove(layerId)) {
        setError(PolyseqError::InvalidLayer);
        return false;
    }
    state_->markers.clearLayer(layerId);
    state_->generation++;
    return true;
}

bool PolyseqEngine::setLayerSpec(std::uint32_t layerId, const polyseq::ShapeSpec& spec) {
    clearError();
    polyseq::Layer* layer = state_->layers.find(layerId);
    if (!layer) {
        setError(PolyseqError::InvalidLayer);
        return false;
    }
    layer->setSpec(spec);
    return true;
}

polyseq::ShapeSpec PolyseqEngine::getLayerSpec(std::uint32_t layerId) const {
    clearError();
    const polyseq::Layer* layer = state_->layers.find(layerId);
    if (!layer) {
        setError(PolyseqError::InvalidLayer);
        return polyseq::ShapeSpec{};
    }
    return layer->targetSpec();
}

bool PolyseqEngine::setLayerVisible(std::uint32_t layerId, bool visible) {
    clearError();
    polyseq::Layer* layer = state_->layers.find(layerId);
    if (!layer) {
        setError(PolyseqError::InvalidLayer);
        return false;
    }
    layer->setVisible(visible);
    return true;
}

std::vector<std::uint32_t> PolyseqEngine::getLayerIds() const {
    return state_->layers.order();
}

std::shared_ptr<const polyseq::GeometryBuffer> PolyseqEngine::getGeometry(std::uint32_t layerId) const {
    clearError();
    const polyseq::Layer* layer = state_->layers.find(layerId);
    if (!layer) {
        setError(PolyseqError::InvalidLayer);
        return std::make_shared<const polyseq::GeometryBuffer>();
    }
    return layer->geometry();
}

std::vector<polyseq::CopyTransform> PolyseqEngine::getTransforms(std::uint32_t layerId) const {
    clearError();
    const polyseq::Layer* layer = state_->layers.find(layerId);
    if (!layer) {
        setError(PolyseqError::InvalidLayer);
        return {};
    }
    return layer->transforms();
}

PolyseqEngine::GeometryMeta PolyseqEngine::getGeometryMeta(std::uint32_t layerId) const {
    clearError();
    auto& vertices = state_->geometryVertexScratch;
    auto& indices = state_->geometryIndexScratch;
    vertices.clear();
    indices.clear();

    const polyseq::Layer* layer = state_->layers.find(layerId);
    if (!layer) {
        setError(PolyseqError::InvalidLayer);
        return GeometryMeta{state_->generation, 0, 0, 0, 0, 0};
    }

    const polyseq::GeometryBuffer& buffer = *layer->geometry();
    vertices.reserve(buffer.vertices.size() * 2);
    for (const polyseq::Point2& p : buffer.vertices) {
        vertices.push_back(static_cast<float>(p.x));
        vertices.push_back(static_cast<float>(p.y));
    }
    indices.reserve(buffer.segments.size() * 2);
    for (const polyseq::LineSegment& s : buffer.segments) {
        indices.push_back(s.a);
        indices.push_back(s.b);
    }

    return GeometryMeta{
        state_->generation,
        static_cast<std::uint32_t>(buffer.vertices.size()),
        buffer.meta.baseVertexCount,
        static_cast<std::uint32_t>(buffer.segments.size()),
        reinterpret_cast<std::uintptr_t>(vertices.data()),
        reinterpret_cast<std::uintptr_t>(indices.data()),
    };
}

void PolyseqEngine::setConfig(const polyseq::EngineConfig& config) {
    clearError();
    polyseq::EngineConfig next = config;
    if (!(next.bpm > 0.0)) {
        POLYSEQ_LOG_WARN("polyseq: ignoring non-positive bpm %f", next.bpm);
        next.bpm = state_->config.bpm;
        setError(PolyseqError::InvalidArgument);
    }
    if (next.overlapThreshold < 0.0) next.overlapThreshold = 0.0;
    if (next.lerpTimeSeconds < 0.0) next.lerpTimeSeconds = 0.0;

    const bool geometryOptionsChanged =
        next.intersections.mergeThreshold != state_->config.intersections.mergeThreshold
        || next.intersections.paramEpsilon != state_->config.intersections.paramEpsilon;

    state_->config = std::move(next);
    applyQuantization();

    if (geometryOptionsChanged) {
        state_->layers.forEach([](polyseq::Layer& layer) { layer.invalidate(); });
    }
}

const polyseq::EngineConfig& PolyseqEngine::getConfig() const noexcept {
    return state_->config;
}

void PolyseqEngine::applyQuantization() {
    if (!state_->config.quantizationEnabled) {
        state_->quantizer.reset();
        return;
    }
    const double gridTicks = polyseq::parseQuantizationGrid(state_->config.quantizationGrid);
    state_->quantizer = std::make_unique<polyseq::Quantizer>(state_->config.bpm, gridTicks);
}

void PolyseqEngine::setNoteResolver(std::shared_ptr<const polyseq::NoteResolver> resolver) {
    state_->resolver = resolver ? std::move(resolver) : state_->defaultResolver;
}

void PolyseqEngine::setNoteParameters(const polyseq::NoteParameters& params) {
    state_->defaultResolver->setParameters(params);
}

void PolyseqEngine::setTriggerSink(std::shared_ptr<polyseq::TriggerSink> sink) {
    state_->sink = std::move(sink);
}

void PolyseqEngine::setObserver(std::shared_ptr<polyseq::EngineObserver> observer) {
    state_->observer = observer ? std::move(observer) : std::make_shared<polyseq::EngineObserver>();
}

void PolyseqEngine::setClockSource(std::shared_ptr<const polyseq::ClockSource> clock) {
    state_->clock = clock ? std::move(clock) : std::make_shared<polyseq::SteadyClockSource>();
}

void PolyseqEngine::resetTriggers() noexcept {
    state_->layers.forEach([](polyseq::Layer& layer) { layer.triggers().reset(); });
}

bool PolyseqEngine::resetLayerTriggers(std::uint32_t layerId) {
    clearError();
    polyseq::Layer* layer = state_->layers.find(layerId);
    if (!layer) {
        setError(PolyseqError::InvalidLayer);
        return false;
    }
    layer->triggers().reset();
    return true;
}

void PolyseqEngine::rearmAllLayers() noexcept {
    state_->layers.forEach([](polyseq::Layer& layer) { layer.triggers().rearm(); });
}

void PolyseqEngine::resetSequentialIndex() noexcept {
    state_->sequence.reset();
}
