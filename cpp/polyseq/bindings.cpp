#ifdef EMSCRIPTEN
#include <emscripten/bind.h>
#include <emscripten/emscripten.h>
#include <emscripten/val.h>
#endif

#include "polyseq/engine.h"

#ifdef EMSCRIPTEN
#include <memory>
#include <utility>

namespace {

// Forwards fired triggers to a JS function as plain objects.
class JsTriggerSink final : public polyseq::TriggerSink {
public:
    explicit JsTriggerSink(emscripten::val callback) : callback_(std::move(callback)) {}

    void dispatch(const polyseq::FiredTrigger& trigger) override {
        emscripten::val note = emscripten::val::object();
        note.set("frequency", trigger.note.frequency);
        note.set("duration", trigger.note.duration);
        note.set("velocity", trigger.note.velocity);
        note.set("pan", trigger.note.pan);
        note.set("pointIndex", static_cast<double>(trigger.note.pointIndex));
        note.set("noteName", trigger.note.noteName);
        note.set("layerId", trigger.source.layerId);
        note.set("copyIndex", trigger.source.copyIndex);
        note.set("vertexIndex", trigger.source.vertexIndex);
        note.set("isIntersection", trigger.source.isIntersection);
        note.set("globalIndex", static_cast<double>(trigger.source.globalIndex));
        note.set("x", trigger.source.position.x);
        note.set("y", trigger.source.position.y);
        note.set("time", trigger.timeSeconds);
        note.set("quantized", trigger.quantized);
        callback_(note);
    }

private:
    emscripten::val callback_;
};

} // namespace

EMSCRIPTEN_BINDINGS(polyseq_module) {
    emscripten::enum_<polyseq::ShapeFamily>("ShapeFamily")
        .value("Regular", polyseq::ShapeFamily::Regular)
        .value("Star", polyseq::ShapeFamily::Star)
        .value("Euclidean", polyseq::ShapeFamily::Euclidean)
        .value("Fractal", polyseq::ShapeFamily::Fractal);

    emscripten::enum_<polyseq::ParameterMode>("ParameterMode")
        .value("Modulo", polyseq::ParameterMode::Modulo)
        .value("Random", polyseq::ParameterMode::Random)
        .value("Interpolation", polyseq::ParameterMode::Interpolation);

    emscripten::enum_<PolyseqError>("PolyseqError")
        .value("Ok", PolyseqError::Ok)
        .value("InvalidLayer", PolyseqError::InvalidLayer)
        .value("RebuildFailed", PolyseqError::RebuildFailed)
        .value("ResolverFailed", PolyseqError::ResolverFailed)
        .value("DispatchFailed", PolyseqError::DispatchFailed)
        .value("EventOverflow", PolyseqError::EventOverflow)
        .value("InvalidArgument", PolyseqError::InvalidArgument);

    emscripten::class_<PolyseqEngine>("PolyseqEngine")
        .constructor<>()
        .function("clear", &PolyseqEngine::clear)
        .function("createLayer", &PolyseqEngine::createLayer)
        .function("deleteLayer", &PolyseqEngine::deleteLayer)
        .function("setLayerSpec", &PolyseqEngine::setLayerSpec)
        .function("getLayerSpec", &PolyseqEngine::getLayerSpec)
        .function("setLayerVisible", &PolyseqEngine::setLayerVisible)
        .function("getLayerIds", &PolyseqEngine::getLayerIds)
        .function("getGeometryMeta", &PolyseqEngine::getGeometryMeta)
        .function("setConfig", &PolyseqEngine::setConfig)
        .function("getConfig", emscripten::optional_override([](const PolyseqEngine& self) {
            return self.getConfig();
        }))
        .function("setNoteParameters", &PolyseqEngine::setNoteParameters)
        .function("setTriggerCallback", emscripten::optional_override([](PolyseqEngine& self, emscripten::val callback) {
            if (callback.isNull() || callback.isUndefined()) {
                self.setTriggerSink(nullptr);
                return;
            }
            self.setTriggerSink(std::make_shared<JsTriggerSink>(std::move(callback)));
        }))
        .function("tick", emscripten::select_overload<polyseq::TickStats(double, double)>(&PolyseqEngine::tick))
        .function("tickNow", emscripten::select_overload<polyseq::TickStats(double)>(&PolyseqEngine::tick))
        .function("setRotationDegrees", &PolyseqEngine::setRotationDegrees)
        .function("getRotationDegrees", &PolyseqEngine::getRotationDegrees)
        .function("resetTriggers", &PolyseqEngine::resetTriggers)
        .function("resetLayerTriggers", &PolyseqEngine::resetLayerTriggers)
        .function("resetSequentialIndex", &PolyseqEngine::resetSequentialIndex)
        .function("pollEvents", &PolyseqEngine::pollEvents)
        .function("ackOverflow", &PolyseqEngine::ackOverflow)
        .function("getLastError", &PolyseqEngine::getLastError)
        .function("getStats", &PolyseqEngine::getStats);

    emscripten::value_object<polyseq::ShapeSpec>("ShapeSpec")
        .field("radius", &polyseq::ShapeSpec::radius)
        .field("segmentCount", &polyseq::ShapeSpec::segmentCount)
        .field("shapeFamily", &polyseq::ShapeSpec::shapeFamily)
        .field("starSkip", &polyseq::ShapeSpec::starSkip)
        .field("useCuts", &polyseq::ShapeSpec::useCuts)
        .field("euclidPulses", &polyseq::ShapeSpec::euclidPulses)
        .field("useFractal", &polyseq::ShapeSpec::useFractal)
        .field("fractalDivisions", &polyseq::ShapeSpec::fractalDivisions)
        .field("copies", &polyseq::ShapeSpec::copies)
        .field("stepScale", &polyseq::ShapeSpec::stepScale)
        .field("angleDegrees", &polyseq::ShapeSpec::angleDegrees)
        .field("startingAngleDegrees", &polyseq::ShapeSpec::startingAngleDegrees)
        .field("useModulus", &polyseq::ShapeSpec::useModulus)
        .field("modulusValue", &polyseq::ShapeSpec::modulusValue)
        .field("useAltScale", &polyseq::ShapeSpec::useAltScale)
        .field("altScale", &polyseq::ShapeSpec::altScale)
        .field("altStepN", &polyseq::ShapeSpec::altStepN)
        .field("useIntersections", &polyseq::ShapeSpec::useIntersections);

    emscripten::value_object<polyseq::IntersectionOptions>("IntersectionOptions")
        .field("mergeThreshold", &polyseq::IntersectionOptions::mergeThreshold)
        .field("paramEpsilon", &polyseq::IntersectionOptions::paramEpsilon);

    emscripten::value_object<polyseq::EngineConfig>("EngineConfig")
        .field("bpm", &polyseq::EngineConfig::bpm)
        .field("quantizationEnabled", &polyseq::EngineConfig::quantizationEnabled)
        .field("quantizationGrid", &polyseq::EngineConfig::quantizationGrid)
        .field("overlapThreshold", &polyseq::EngineConfig::overlapThreshold)
        .field("rearmPerRevolution", &polyseq::EngineConfig::rearmPerRevolution)
        .field("lerpTimeSeconds", &polyseq::EngineConfig::lerpTimeSeconds)
        .field("intersections", &polyseq::EngineConfig::intersections);

    emscripten::value_object<polyseq::ParameterRange>("ParameterRange")
        .field("min", &polyseq::ParameterRange::min)
        .field("max", &polyseq::ParameterRange::max)
        .field("modulo", &polyseq::ParameterRange::modulo)
        .field("mode", &polyseq::ParameterRange::mode)
        .field("phase", &polyseq::ParameterRange::phase);

    emscripten::value_object<polyseq::NoteParameters>("NoteParameters")
        .field("duration", &polyseq::NoteParameters::duration)
        .field("velocity", &polyseq::NoteParameters::velocity)
        .field("useEqualTemperament", &polyseq::NoteParameters::useEqualTemperament)
        .field("referenceFrequency", &polyseq::NoteParameters::referenceFrequency);

    emscripten::value_object<polyseq::TickStats>("TickStats")
        .field("crossingsDetected", &polyseq::TickStats::crossingsDetected)
        .field("triggersFired", &polyseq::TickStats::triggersFired)
        .field("triggersSuppressed", &polyseq::TickStats::triggersSuppressed)
        .field("triggersScheduled", &polyseq::TickStats::triggersScheduled)
        .field("pendingFlushed", &polyseq::TickStats::pendingFlushed)
        .field("callbackFailures", &polyseq::TickStats::callbackFailures)
        .field("resolverFailures", &polyseq::TickStats::resolverFailures)
        .field("rebuilds", &polyseq::TickStats::rebuilds)
        .field("rebuildFailures", &polyseq::TickStats::rebuildFailures)
        .field("pendingCount", &polyseq::TickStats::pendingCount)
        .field("markerCount", &polyseq::TickStats::markerCount)
        .field("rotationDegrees", &polyseq::TickStats::rotationDegrees)
        .field("wrapped", &polyseq::TickStats::wrapped);

    emscripten::value_object<PolyseqEngine::EventBufferMeta>("EventBufferMeta")
        .field("generation", &PolyseqEngine::EventBufferMeta::generation)
        .field("count", &PolyseqEngine::EventBufferMeta::count)
        .field("ptr", &PolyseqEngine::EventBufferMeta::ptr);

    emscripten::value_object<PolyseqEngine::GeometryMeta>("GeometryMeta")
        .field("generation", &PolyseqEngine::GeometryMeta::generation)
        .field("vertexCount", &PolyseqEngine::GeometryMeta::vertexCount)
        .field("baseVertexCount", &PolyseqEngine::GeometryMeta::baseVertexCount)
        .field("segmentCount", &PolyseqEngine::GeometryMeta::segmentCount)
        .field("vertexPtr", &PolyseqEngine::GeometryMeta::vertexPtr)
        .field("indexPtr", &PolyseqEngine::GeometryMeta::indexPtr);

    emscripten::value_object<PolyseqEngine::EngineStats>("EngineStats")
        .field("generation", &PolyseqEngine::EngineStats::generation)
        .field("layerCount", &PolyseqEngine::EngineStats::layerCount)
        .field("pendingCount", &PolyseqEngine::EngineStats::pendingCount)
        .field("markerCount", &PolyseqEngine::EngineStats::markerCount)
        .field("nextSequentialIndex", &PolyseqEngine::EngineStats::nextSequentialIndex)
        .field("revolutions", &PolyseqEngine::EngineStats::revolutions)
        .field("rotationDegrees", &PolyseqEngine::EngineStats::rotationDegrees)
        .field("lastTickMs", &PolyseqEngine::EngineStats::lastTickMs)
        .field("lastTick", &PolyseqEngine::EngineStats::lastTick);

    emscripten::register_vector<std::uint32_t>("VectorUInt32");
}
#endif
