#pragma once

#include "polyseq/engine_config.h"
#include "polyseq/core/types.h"
#include "polyseq/geometry/copy_transformer.h"
#include "polyseq/geometry/geometry_buffer.h"
#include "polyseq/notes/note_resolver.h"
#include "polyseq/shape/shape_spec.h"
#include "polyseq/time/clock_source.h"
#include "polyseq/trigger/engine_observer.h"
#include "polyseq/trigger/marker_tracker.h"
#include "polyseq/trigger/trigger_sink.h"
#include "polyseq/trigger/trigger_types.h"

#include <cstdint>
#include <memory>
#include <vector>

struct EngineState;
class PolyseqEngineTestAccessor;

// Host-facing entry point. Owns the layers, the rotation clock and all trigger
// state; driven one frame at a time through tick().
class PolyseqEngine {
    friend class PolyseqEngineTestAccessor;
public:
    struct EventBufferMeta {
        std::uint32_t generation;
        std::uint32_t count;
        std::uintptr_t ptr;
    };

    // Flat float32 xy pairs and uint32 index pairs for the renderer.
    struct GeometryMeta {
        std::uint32_t generation;
        std::uint32_t vertexCount;
        std::uint32_t baseVertexCount;
        std::uint32_t segmentCount;
        std::uintptr_t vertexPtr;
        std::uintptr_t indexPtr;
    };

    struct EngineStats {
        std::uint32_t generation;
        std::uint32_t layerCount;
        std::uint32_t pendingCount;
        std::uint32_t markerCount;
        std::uint32_t nextSequentialIndex;
        std::uint32_t revolutions;
        double rotationDegrees;
        float lastTickMs;
        polyseq::TickStats lastTick;
    };

    PolyseqEngine();
    ~PolyseqEngine();

    PolyseqEngine(const PolyseqEngine&) = delete;
    PolyseqEngine& operator=(const PolyseqEngine&) = delete;

    // Drops every layer, trigger, event and marker. Collaborators and config are kept.
    void clear() noexcept;

    // Layers
    std::uint32_t createLayer(const polyseq::ShapeSpec& spec);
    bool deleteLayer(std::uint32_t layerId);
    bool setLayerSpec(std::uint32_t layerId, const polyseq::ShapeSpec& spec);
    polyseq::ShapeSpec getLayerSpec(std::uint32_t layerId) const;
    bool setLayerVisible(std::uint32_t layerId, bool visible);
    std::vector<std::uint32_t> getLayerIds() const;

    // Latest published buffer; empty buffer for unknown layers.
    std::shared_ptr<const polyseq::GeometryBuffer> getGeometry(std::uint32_t layerId) const;
    std::vector<polyseq::CopyTransform> getTransforms(std::uint32_t layerId) const;
    GeometryMeta getGeometryMeta(std::uint32_t layerId) const;

    // Configuration and collaborators
    void setConfig(const polyseq::EngineConfig& config);
    const polyseq::EngineConfig& getConfig() const noexcept;
    void setNoteResolver(std::shared_ptr<const polyseq::NoteResolver> resolver);
    void setNoteParameters(const polyseq::NoteParameters& params);
    void setTriggerSink(std::shared_ptr<polyseq::TriggerSink> sink);
    void setObserver(std::shared_ptr<polyseq::EngineObserver> observer);
    void setClockSource(std::shared_ptr<const polyseq::ClockSource> clock);

    // Frame entry point: rebuild dirty layers, advance rotation, detect crossings,
    // flush due pending triggers, age markers.
    polyseq::TickStats tick(double dtSeconds, double nowSeconds);
    polyseq::TickStats tick(double dtSeconds);

    // Rotation
    void setRotationDegrees(double degrees) noexcept;
    double getRotationDegrees() const noexcept;

    // Trigger state
    void resetTriggers() noexcept;
    bool resetLayerTriggers(std::uint32_t layerId);
    void resetSequentialIndex() noexcept;

    // Events and markers
    EventBufferMeta pollEvents(std::uint32_t maxEvents);
    void ackOverflow() noexcept;
    const std::vector<polyseq::Marker>& getMarkers() const noexcept;

    PolyseqError getLastError() const noexcept;
    EngineStats getStats() const noexcept;

private:
    EngineState& state() noexcept { return *state_; }
    const EngineState& state() const noexcept { return *state_; }

    void clearError() const noexcept;
    void setError(PolyseqError err) const noexcept;

    void applyQuantization();
    void rebuildLayers(double dtSeconds, polyseq::TickStats& stats);
    void detectTriggers(double previousAngle, double currentAngle, double nowSeconds, double frameSeconds, polyseq::TickStats& stats);
    void flushPending(double nowSeconds, polyseq::TickStats& stats);
    void fireTrigger(const polyseq::FiredTrigger& trigger, bool fromPending, polyseq::TickStats& stats);
    void rearmAllLayers() noexcept;

    // Event stream
    void clearEventState() noexcept;
    bool pushEvent(const polyseq::TriggerEvent& ev) noexcept;
    void recordTriggerFired(const polyseq::FiredTrigger& trigger, bool fromPending) noexcept;

    std::unique_ptr<EngineState> state_;
};
