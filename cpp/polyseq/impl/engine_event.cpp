// PolyseqEngine trigger event stream

#include "polyseq/engine.h"
#include "polyseq/internal/engine_state.h"

#include "polyseq/core/logging.h"

#include <algorithm>

void PolyseqEngine::clearEventState() noexcept {
    state_->eventHead = 0;
    state_->eventTail = 0;
    state_->eventCount = 0;
    state_->eventOverflowed = false;
    state_->eventOverflowGeneration = 0;
    state_->eventBuffer.clear();
}

bool PolyseqEngine::pushEvent(const polyseq::TriggerEvent& ev) noexcept {
    EngineState& s = *state_;
    if (s.eventOverflowed) return false;
    if (s.eventCount >= polyseq::kMaxEvents) {
        s.eventOverflowed = true;
        s.eventOverflowGeneration = s.generation;
        s.eventHead = 0;
        s.eventTail = 0;
        s.eventCount = 0;
        setError(PolyseqError::EventOverflow);
        POLYSEQ_LOG_WARN("polyseq: event queue overflow, dropping %zu queued events", polyseq::kMaxEvents);
        return false;
    }
    s.eventQueue[s.eventTail] = ev;
    s.eventTail = (s.eventTail + 1) % polyseq::kMaxEvents;
    s.eventCount++;
    return true;
}

void PolyseqEngine::recordTriggerFired(const polyseq::FiredTrigger& trigger, bool fromPending) noexcept {
    std::uint16_t flags = 0;
    if (trigger.quantized) flags |= static_cast<std::uint16_t>(polyseq::TriggerEventFlags::Quantized);
    if (trigger.source.isIntersection) flags |= static_cast<std::uint16_t>(polyseq::TriggerEventFlags::Intersection);
    if (fromPending) flags |= static_cast<std::uint16_t>(polyseq::TriggerEventFlags::FromPending);

    pushEvent(polyseq::TriggerEvent{
        static_cast<std::uint16_t>(polyseq::TriggerEventType::TriggerFired),
        flags,
        trigger.source.layerId,
        static_cast<std::uint32_t>(trigger.source.globalIndex),
        trigger.source.copyIndex,
        trigger.source.vertexIndex,
        static_cast<float>(trigger.source.position.x),
        static_cast<float>(trigger.source.position.y),
        static_cast<float>(trigger.note.frequency),
        static_cast<float>(trigger.note.duration),
        static_cast<float>(trigger.note.velocity),
        trigger.timeSeconds,
    });
}

PolyseqEngine::EventBufferMeta PolyseqEngine::pollEvents(std::uint32_t maxEvents) {
    EngineState& s = *state_;
    s.eventBuffer.clear();

    // While overflowed, only the overflow marker is reported until ackOverflow().
    if (s.eventOverflowed) {
        s.eventBuffer.push_back(polyseq::TriggerEvent{
            static_cast<std::uint16_t>(polyseq::TriggerEventType::Overflow),
            0,
            0,
            s.eventOverflowGeneration,
            0,
            0,
            0.0f,
            0.0f,
            0.0f,
            0.0f,
            0.0f,
            0.0,
        });
        return EventBufferMeta{
            s.generation,
            static_cast<std::uint32_t>(s.eventBuffer.size()),
            reinterpret_cast<std::uintptr_t>(s.eventBuffer.data()),
        };
    }

    if (s.eventCount == 0 || maxEvents == 0) {
        return EventBufferMeta{s.generation, 0, 0};
    }

    const std::size_t count = std::min<std::size_t>(maxEvents, s.eventCount);
    s.eventBuffer.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        s.eventBuffer.push_back(s.eventQueue[s.eventHead]);
        s.eventHead = (s.eventHead + 1) % polyseq::kMaxEvents;
        s.eventCount--;
    }

    return EventBufferMeta{
        s.generation,
        static_cast<std::uint32_t>(s.eventBuffer.size()),
        reinterpret_cast<std::uintptr_t>(s.eventBuffer.data()),
    };
}

void PolyseqEngine::ackOverflow() noexcept {
    EngineState& s = *state_;
    if (!s.eventOverflowed) return;
    s.eventOverflowed = false;
    s.eventOverflowGeneration = 0;
    s.eventHead = 0;
    s.eventTail = 0;
    s.eventCount = 0;
}
