#pragma once

#include "polyseq/engine_config.h"
#include "polyseq/core/types.h"
#include "polyseq/geometry/copy_transformer.h"
#include "polyseq/layer/layer_store.h"
#include "polyseq/notes/note_resolver.h"
#include "polyseq/time/clock_source.h"
#include "polyseq/time/musical_time.h"
#include "polyseq/trigger/engine_observer.h"
#include "polyseq/trigger/marker_tracker.h"
#include "polyseq/trigger/quantizer.h"
#include "polyseq/trigger/sequence_counter.h"
#include "polyseq/trigger/trigger_sink.h"
#include "polyseq/trigger/trigger_types.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

struct EngineState {
    EngineState();

    EngineState(const EngineState&) = delete;
    EngineState& operator=(const EngineState&) = delete;

    polyseq::EngineConfig config{};
    std::unique_ptr<polyseq::Quantizer> quantizer; // null while quantization is disabled

    polyseq::LayerStore layers;
    polyseq::CopyTransformer transformer;
    polyseq::RotationClock rotation;
    polyseq::SequenceCounter sequence;
    polyseq::MarkerTracker markers;

    std::shared_ptr<polyseq::ParametricNoteResolver> defaultResolver;
    std::shared_ptr<const polyseq::NoteResolver> resolver;
    std::shared_ptr<polyseq::TriggerSink> sink;
    std::shared_ptr<polyseq::EngineObserver> observer;
    std::shared_ptr<const polyseq::ClockSource> clock;

    std::uint32_t generation{1};
    polyseq::TickStats lastTick{};
    float lastTickMs{0.0f};

    // Scratch reused across ticks
    std::vector<polyseq::PendingTrigger> dueScratch;
    mutable std::vector<float> geometryVertexScratch;
    mutable std::vector<std::uint32_t> geometryIndexScratch;

    std::vector<polyseq::TriggerEvent> eventQueue{};
    std::size_t eventHead{0};
    std::size_t eventTail{0};
    std::size_t eventCount{0};
    bool eventOverflowed{false};
    std::uint32_t eventOverflowGeneration{0};
    std::vector<polyseq::TriggerEvent> eventBuffer{};

    mutable PolyseqError lastError{PolyseqError::Ok};
};
