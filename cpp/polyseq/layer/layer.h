#ifndef POLYSEQ_LAYER_LAYER_H
#define POLYSEQ_LAYER_LAYER_H

#include "polyseq/geometry/copy_transformer.h"
#include "polyseq/geometry/geometry_assembler.h"
#include "polyseq/geometry/geometry_buffer.h"
#include "polyseq/shape/shape_spec.h"
#include "polyseq/trigger/trigger_engine.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace polyseq {

struct RebuildResult {
    bool geometryChanged{false};
    bool transformsChanged{false};
    PolyseqError error{PolyseqError::Ok};
    std::string message;
};

// One rotating shape: its spec (target and lerped current), the published geometry
// snapshot, per-copy transforms and its own trigger state.
class Layer {
public:
    Layer(std::uint32_t id, const ShapeSpec& spec);

    std::uint32_t id() const noexcept { return id_; }

    void setSpec(const ShapeSpec& spec);
    const ShapeSpec& targetSpec() const noexcept { return target_; }
    const ShapeSpec& currentSpec() const noexcept { return current_; }

    // Moves the continuous fields toward the target by min(1, dt / lerpTime).
    // lerpTime <= 0 snaps. Returns true while still approaching the target.
    bool advanceLerp(double dtSeconds, double lerpTimeSeconds);
    bool isLerping() const noexcept;

    // Rebuilds into a fresh buffer and swaps only on success. On failure the previous
    // buffer stays published and the result carries RebuildFailed.
    RebuildResult rebuildIfDirty(const IntersectionOptions& options, const CopyTransformer& transformer);

    // Forces the next rebuildIfDirty to rebuild.
    void invalidate() noexcept;

    const std::shared_ptr<const GeometryBuffer>& geometry() const noexcept { return geometry_; }
    const std::vector<CopyTransform>& transforms() const noexcept { return transforms_; }

    // Has copies and a non-empty outline; only materialized layers are drawn or triggered.
    bool isMaterialized() const noexcept;

    bool visible() const noexcept { return visible_; }
    void setVisible(bool visible) noexcept { visible_ = visible; }

    TriggerEngine& triggers() noexcept { return triggers_; }
    const TriggerEngine& triggers() const noexcept { return triggers_; }

private:
    std::uint32_t id_;
    ShapeSpec target_;
    ShapeSpec current_;
    SpecSnapshot geometrySnapshot_;
    SpecSnapshot transformSnapshot_;
    std::shared_ptr<const GeometryBuffer> geometry_;
    std::vector<CopyTransform> transforms_;
    TriggerEngine triggers_;
    bool visible_{true};
};

} // namespace polyseq

#endif // POLYSEQ_LAYER_LAYER_H
