#include "polyseq/layer/layer_store.h"

#include <algorithm>

namespace polyseq {

Layer& LayerStore::create(const ShapeSpec& spec) {
    const std::uint32_t id = nextId_++;
    auto layer = std::make_unique<Layer>(id, spec);
    Layer& ref = *layer;
    layers_.emplace(id, std::move(layer));
    order_.push_back(id);
    return ref;
}

bool LayerStore::remove(std::uint32_t id) {
    if (layers_.erase(id) == 0) return false;
    order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());
    return true;
}

void LayerStore::clear() noexcept {
    layers_.clear();
    order_.clear();
}

Layer* LayerStore::find(std::uint32_t id) noexcept {
    const auto it = layers_.find(id);
    return it == layers_.end() ? nullptr : it->second.get();
}

const Layer* LayerStore::find(std::uint32_t id) const noexcept {
    const auto it = layers_.find(id);
    return it == layers_.end() ? nullptr : it->second.get();
}

} // namespace polyseq
