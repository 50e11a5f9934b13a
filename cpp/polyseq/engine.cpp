#include "polyseq/engine.h"

#include "polyseq/internal/engine_state.h"

EngineState::EngineState()
    : defaultResolver(std::make_shared<polyseq::ParametricNoteResolver>()),
      resolver(defaultResolver),
      observer(std::make_shared<polyseq::EngineObserver>()),
      clock(std::make_shared<polyseq::SteadyClockSource>()) {
    eventQueue.resize(polyseq::kMaxEvents);
    eventBuffer.reserve(polyseq::kMaxEvents + 1);
}

PolyseqEngine::PolyseqEngine() : state_(std::make_unique<EngineState>()) {}

PolyseqEngine::~PolyseqEngine() = default;

void PolyseqEngine::clear() noexcept {
    state_->layers.clear();
    state_->markers.clear();
    state_->sequence.reset();
    state_->rotation.reset();
    state_->lastTick = polyseq::TickStats{};
    clearEventState();
    clearError();
    state_->generation++;
}

void PolyseqEngine::clearError() const noexcept {
    state_->lastError = PolyseqError::Ok;
}

void PolyseqEngine::setError(PolyseqError err) const noexcept {
    state_->lastError = err;
}

PolyseqError PolyseqEngine::getLastError() const noexcept {
    return state_->lastError;
}

PolyseqEngine::EngineStats PolyseqEngine::getStats() const noexcept {
    std::uint32_t pending = 0;
    state_->layers.forEach([&](const polyseq::Layer& layer) {
        pending += static_cast<std::uint32_t>(layer.triggers().pendingCount());
    });
    return EngineStats{
        state_->generation,
        static_cast<std::uint32_t>(state_->layers.size()),
        pending,
        static_cast<std::uint32_t>(state_->markers.size()),
        static_cast<std::uint32_t>(state_->sequence.peek()),
        static_cast<std::uint32_t>(state_->rotation.revolutions()),
        state_->rotation.angleDegrees(),
        state_->lastTickMs,
        state_->lastTick,
    };
}

void PolyseqEngine::setRotationDegrees(double degrees) noexcept {
    state_->rotation.reset(degrees);
}

double PolyseqEngine::getRotationDegrees() const noexcept {
    return state_->rotation.angleDegrees();
}

const std::vector<polyseq::Marker>& PolyseqEngine::getMarkers() const noexcept {
    return state_->markers.markers();
}
