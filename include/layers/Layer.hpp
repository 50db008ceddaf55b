#pragma once

#include "layers/LayerErrors.hpp"

#include <concepts>
#include <cstdint>
#include <string>
#include <utility>

namespace nl::layers {

// The 32 layer slots. A Layer is a label, not a number: there is no Layer | Layer.
// Use Mask to combine layers.
enum class Layer : uint8_t {
    Default         = 0,
    TransparentFX   = 1,
    IgnoreRaycast   = 2,
    L3              = 3,
    Water           = 4,
    UI              = 5,
    L6              = 6,
    L7              = 7,
    Clickables      = 8,
    L9              = 9,
    L10             = 10,
    L11             = 11,
    L12             = 12,
    L13             = 13,
    L14             = 14,
    L15             = 15,
    L16             = 16,
    L17             = 17,
    L18             = 18,
    L19             = 19,
    L20             = 20,
    L21             = 21,
    L22             = 22,
    L23             = 23,
    L24             = 24,
    L25             = 25,
    L26             = 26,
    L27             = 27,
    L28             = 28,
    L29             = 29,
    L30             = 30,
    L31             = 31,
};

inline constexpr unsigned int LAYER_COUNT = 32;

// Plain integers accepted as layer indices. bool and the character types are not indices.
template <typename T>
concept LayerIndex = std::integral<T>
                     && !std::same_as<T, bool>
                     && !std::same_as<T, char>
                     && !std::same_as<T, wchar_t>
                     && !std::same_as<T, char8_t>
                     && !std::same_as<T, char16_t>
                     && !std::same_as<T, char32_t>;

template <LayerIndex T>
unsigned int checkedIndex(const T index) {
    if (std::cmp_less(index, 0) || std::cmp_greater_equal(index, LAYER_COUNT))
        throw OutOfRangeLayer(std::to_string(index));
    return static_cast<unsigned int>(index);
}

unsigned int toIndex(Layer layer);
Layer layerFromIndex(int index);

}
