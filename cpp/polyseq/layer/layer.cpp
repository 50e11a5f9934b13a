#include "polyseq/layer/layer.h"

#include "polyseq/core/logging.h"

#include <algorithm>
#include <cmath>
#include <exception>
#include <stdexcept>
#include <utility>

namespace polyseq {

namespace {

// Below this the lerped value snaps onto its target.
constexpr double kLerpSnapEpsilon = 1e-6;

bool approach(double& value, double target, double factor) noexcept {
    if (std::fabs(target - value) <= kLerpSnapEpsilon) {
        value = target;
        return false;
    }
    value += (target - value) * factor;
    if (std::fabs(target - value) <= kLerpSnapEpsilon) value = target;
    return value != target;
}

// Every copy places every vertex once per frame during detection.
void ensurePlacedVertexBudget(const GeometryBuffer& geometry, std::size_t copies) {
    if (copies != 0 && geometry.vertices.size() > kMaxGeometryVertices / copies) {
        throw std::length_error("polyseq: placed vertex budget exceeded");
    }
}

} // namespace

Layer::Layer(std::uint32_t id, const ShapeSpec& spec)
    : id_(id),
      target_(sanitizeShapeSpec(spec)),
      current_(target_),
      geometry_(std::make_shared<const GeometryBuffer>()),
      triggers_(id) {}

void Layer::setSpec(const ShapeSpec& spec) {
    const ShapeSpec next = sanitizeShapeSpec(spec);
    target_ = next;

    // Only the continuous fields are interpolated; everything else snaps.
    ShapeSpec merged = next;
    merged.radius = current_.radius;
    merged.stepScale = current_.stepScale;
    merged.angleDegrees = current_.angleDegrees;
    merged.startingAngleDegrees = current_.startingAngleDegrees;
    merged.altScale = current_.altScale;
    current_ = merged;
}

bool Layer::advanceLerp(double dtSeconds, double lerpTimeSeconds) {
    const double factor = lerpTimeSeconds > 0.0
        ? std::clamp(dtSeconds / lerpTimeSeconds, 0.0, 1.0)
        : 1.0;
    bool moving = false;
    moving |= approach(current_.radius, target_.radius, factor);
    moving |= approach(current_.stepScale, target_.stepScale, factor);
    moving |= approach(current_.angleDegrees, target_.angleDegrees, factor);
    moving |= approach(current_.startingAngleDegrees, target_.startingAngleDegrees, factor);
    moving |= approach(current_.altScale, target_.altScale, factor);
    return moving;
}

bool Layer::isLerping() const noexcept {
    return current_.radius != target_.radius
        || current_.stepScale != target_.stepScale
        || current_.angleDegrees != target_.angleDegrees
        || current_.startingAngleDegrees != target_.startingAngleDegrees
        || current_.altScale != target_.altScale;
}

void Layer::invalidate() noexcept {
    geometrySnapshot_.clear();
    transformSnapshot_.clear();
}

RebuildResult Layer::rebuildIfDirty(const IntersectionOptions& options, const CopyTransformer& transformer) {
    RebuildResult result;
    const bool geometryDirty = geometrySnapshot_.requiresRebuild(current_);
    if (!geometryDirty && !transformSnapshot_.transformsChanged(current_)) return result;

    try {
        std::shared_ptr<const GeometryBuffer> nextGeometry =
            geometryDirty ? buildGeometry(current_, options, transformer) : geometry_;
        std::vector<CopyTransform> nextTransforms = transformer.transformsFor(current_);
        ensurePlacedVertexBudget(*nextGeometry, nextTransforms.size());

        geometry_ = std::move(nextGeometry);
        transforms_ = std::move(nextTransforms);
        if (geometryDirty) geometrySnapshot_.capture(current_);
        transformSnapshot_.capture(current_);
        result.geometryChanged = geometryDirty;
        result.transformsChanged = true;
    } catch (const std::exception& e) {
        result.error = PolyseqError::RebuildFailed;
        result.message = e.what();
        POLYSEQ_LOG_WARN("polyseq: layer %u rebuild failed, keeping previous geometry: %s", id_, e.what());
        return result;
    }

    // Trigger keys refer to vertex indices and transformed positions of the old state.
    triggers_.reset();
    return result;
}

bool Layer::isMaterialized() const noexcept {
    return !transforms_.empty() && geometry_ && !geometry_->empty();
}

} // namespace polyseq
