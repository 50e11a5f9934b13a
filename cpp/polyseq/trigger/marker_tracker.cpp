#include "polyseq/trigger/marker_tracker.h"

#include <algorithm>

namespace polyseq {

void MarkerTracker::add(const FiredTrigger& trigger) {
    Marker m;
    m.layerId = trigger.source.layerId;
    m.globalIndex = trigger.source.globalIndex;
    m.position = trigger.source.position;
    m.frequency = trigger.note.frequency;
    m.duration = trigger.note.duration;
    m.velocity = trigger.note.velocity;
    m.quantized = trigger.quantized;
    m.opacity = trigger.note.velocity;
    markers_.push_back(m);
}

void MarkerTracker::age() {
    for (Marker& m : markers_) {
        if (m.life > 0) --m.life;
        m.opacity = m.originalLife > 0
            ? m.velocity * static_cast<double>(m.life) / static_cast<double>(m.originalLife)
            : 0.0;
    }
    markers_.erase(
        std::remove_if(markers_.begin(), markers_.end(), [](const Marker& m) { return m.life == 0; }),
        markers_.end());
}

void MarkerTracker::clearLayer(std::uint32_t layerId) {
    markers_.erase(
        std::remove_if(markers_.begin(), markers_.end(), [layerId](const Marker& m) { return m.layerId == layerId; }),
        markers_.end());
}

} // namespace polyseq
