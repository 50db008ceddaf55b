#pragma once

#include "layers/Mask.hpp"

#include <bit>
#include <concepts>

namespace nl::layers {

// Batch containment checks over a mask, e.g.
//   mask.contains().any(Layer::Water, Layer::UI)
//   mask.contains().only(walls, Layer::Floor)
// Holds a reference to the mask; do not keep it past the mask's lifetime.
// Every candidate is evaluated, so an invalid index throws even after a match.
class ContainsQuery {
public:
    explicit ContainsQuery(const Mask& mask) noexcept : mask_(mask) {}

    // Vacuously true without candidates.
    template <MaskOperand... Ts>
    [[nodiscard]] bool all(const Ts&... others) const { return (containsOne(others) & ... & true); }

    // Mask-shaped candidates only count when they are non-empty.
    template <MaskOperand... Ts>
    [[nodiscard]] bool any(const Ts&... others) const { return (overlapsOne(others) | ... | false); }

    template <MaskOperand... Ts>
    [[nodiscard]] bool none(const Ts&... others) const { return !any(others...); }

    // Every candidate is contained and together they cover every layer of the mask.
    template <MaskOperand... Ts>
    [[nodiscard]] bool only(const Ts&... others) const {
        if (!all(others...)) return false;
        const uint32_t covered = (Mask::bitsOf(others) | ... | 0u);
        return static_cast<std::size_t>(std::popcount(covered)) == mask_.layerCount();
    }

private:
    const Mask& mask_;

    template <typename T>
    bool containsOne(const T& other) const {
        if constexpr (std::same_as<T, Layer> || LayerIndex<T>) return mask_.contains(other);
        else return mask_.contains(Mask::coerce(other));
    }

    template <typename T>
    bool overlapsOne(const T& other) const {
        if constexpr (std::same_as<T, Layer> || LayerIndex<T>) return mask_.contains(other);
        else return mask_.containsAndNotEmpty(Mask::coerce(other));
    }
};

}
