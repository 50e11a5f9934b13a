#ifndef POLYSEQ_TRIGGER_MARKER_TRACKER_H
#define POLYSEQ_TRIGGER_MARKER_TRACKER_H

#include "polyseq/core/types.h"
#include "polyseq/trigger/trigger_types.h"

#include <cstdint>
#include <vector>

namespace polyseq {

// Short-lived record of a fired trigger for visualization collaborators.
struct Marker {
    std::uint32_t layerId{0};
    std::uint64_t globalIndex{0};
    Point2 position{0.0, 0.0};
    double frequency{0.0};
    double duration{0.0};
    double velocity{0.0};
    bool quantized{false};
    std::uint32_t life{kMarkerLifeFrames};
    std::uint32_t originalLife{kMarkerLifeFrames};
    double opacity{0.0};
};

class MarkerTracker {
public:
    void add(const FiredTrigger& trigger);

    // One frame: life -= 1, opacity = velocity * life / originalLife, expired markers removed.
    void age();

    void clear() noexcept { markers_.clear(); }
    void clearLayer(std::uint32_t layerId);

    const std::vector<Marker>& markers() const noexcept { return markers_; }
    std::size_t size() const noexcept { return markers_.size(); }

private:
    std::vector<Marker> markers_;
};

} // namespace polyseq

#endif // POLYSEQ_TRIGGER_MARKER_TRACKER_H
