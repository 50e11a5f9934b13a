#ifndef POLYSEQ_LAYER_LAYER_STORE_H
#define POLYSEQ_LAYER_LAYER_STORE_H

#include "polyseq/layer/layer.h"

#include <cstdint>
#include <memory>
#include <unordered_map>
#include <vector>

namespace polyseq {

// Layers by id, iterated in creation order.
class LayerStore {
public:
    Layer& create(const ShapeSpec& spec);
    bool remove(std::uint32_t id);
    void clear() noexcept;

    Layer* find(std::uint32_t id) noexcept;
    const Layer* find(std::uint32_t id) const noexcept;

    const std::vector<std::uint32_t>& order() const noexcept { return order_; }
    std::size_t size() const noexcept { return layers_.size(); }

    template <typename Fn>
    void forEach(Fn&& fn) {
        for (const std::uint32_t id : order_) fn(*layers_.at(id));
    }

    template <typename Fn>
    void forEach(Fn&& fn) const {
        for (const std::uint32_t id : order_) fn(static_cast<const Layer&>(*layers_.at(id)));
    }

private:
    std::unordered_map<std::uint32_t, std::unique_ptr<Layer>> layers_;
    std::vector<std::uint32_t> order_;
    std::uint32_t nextId_{1};
};

} // namespace polyseq

#endif // POLYSEQ_LAYER_LAYER_STORE_H
