#pragma once

#include "layers/Layer.hpp"

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include <ranges>
#include <string>
#include <type_traits>
#include <vector>
#include <fmt/format.h>
#include <nlohmann/json_fwd.hpp>

namespace nl::layers {

class Mask;
class ContainsQuery;
class IsQuery;

template <typename T>
concept MaskScalar = std::same_as<T, Mask> || std::same_as<T, Layer> || LayerIndex<T>;

// Any range of masks, layers or layer indices. Mask itself iterates its layers but is
// never treated as a collection.
template <typename T>
concept LayerCollection = !std::same_as<T, Mask>
                          && std::ranges::input_range<const T>
                          && MaskScalar<std::remove_cvref_t<std::ranges::range_value_t<const T>>>;

template <typename T>
concept MaskOperand = MaskScalar<std::remove_cvref_t<T>> || LayerCollection<std::remove_cvref_t<T>>;

/**
 * Immutable set of layers backed by a 32-bit pattern, one bit per layer index.
 *
 * Every integer handed to a Mask is a layer index (0-31), never a ready-made bitmask.
 * Mask(3) is layer 3, not bits 0 and 1. Use Mask::fromBits when you really hold bits.
 *
 * Equality is stricter than containment: Mask(1, 2).contains(1) holds, Mask(1, 2) == 1 does not.
 */
class Mask {
public:
    using const_iterator = std::vector<Layer>::const_iterator;

    Mask() = default;

    template <typename... Ts>
        requires(sizeof...(Ts) > 0
                 && (MaskOperand<Ts> && ...)
                 && !(sizeof...(Ts) == 1 && (std::same_as<Ts, Mask> && ...)))
    explicit Mask(const Ts&... parts) : Mask(RawBits{}, (bitsOf(parts) | ...)) {}

    [[nodiscard]] static Mask fromBits(uint32_t bits);
    [[nodiscard]] static Mask fromLayer(int layer);
    [[nodiscard]] static const Mask& allLayers();

    // Collapses any operand shape into its bit pattern, validating layer indices on the way.
    template <typename T>
    [[nodiscard]] static uint32_t bitsOf(const T& operand) {
        if constexpr (std::same_as<T, Mask>) return operand.bits_;
        else if constexpr (std::same_as<T, Layer>) return 1u << toIndex(operand);
        else if constexpr (LayerIndex<T>) return 1u << checkedIndex(operand);
        else {
            static_assert(LayerCollection<T>, "unsupported mask operand");
            uint32_t bits = 0;
            for (const auto& part : operand) bits |= bitsOf(part);
            return bits;
        }
    }

    template <MaskOperand T>
    [[nodiscard]] static Mask coerce(const T& operand) {
        if constexpr (std::same_as<T, Mask>) return operand;
        else return fromBits(bitsOf(operand));
    }

    [[nodiscard]] uint32_t bits() const noexcept { return bits_; }
    [[nodiscard]] bool isNonEmpty() const noexcept { return bits_ != 0; }
    [[nodiscard]] std::size_t layerCount() const noexcept { return layers_.size(); }
    [[nodiscard]] const std::vector<Layer>& layers() const noexcept { return layers_; }

    [[nodiscard]] const_iterator begin() const noexcept { return layers_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return layers_.end(); }

    // The empty mask is contained by every mask.
    [[nodiscard]] bool contains(const Mask& other) const noexcept { return (other.bits_ & ~bits_) == 0; }
    [[nodiscard]] bool containsAndNotEmpty(const Mask& other) const noexcept {
        return other.isNonEmpty() && contains(other);
    }
    [[nodiscard]] bool contains(const Layer layer) const { return (bits_ & bitsOf(layer)) != 0; }

    template <LayerIndex T>
    [[nodiscard]] bool contains(const T layer) const { return (bits_ & bitsOf(layer)) != 0; }

    template <LayerCollection T>
    [[nodiscard]] bool contains(const T& collection) const { return contains(coerce(collection)); }

    // mask.contains().any(...), .all(...), .none(...), .only(...)
    [[nodiscard]] ContainsQuery contains() const;

    // mask.is().exactly(...), .any(...), .notExactly(...), .none(...)
    [[nodiscard]] IsQuery is() const;

    // Shorthand for is().exactly(candidates...), defined in IsQuery.hpp
    template <MaskOperand... Ts>
        requires(sizeof...(Ts) > 0)
    [[nodiscard]] bool is(const Ts&... candidates) const;

    [[nodiscard]] bool operator==(const Mask& other) const noexcept { return bits_ == other.bits_; }

private:
    struct RawBits {};

    Mask(RawBits, uint32_t bits);

    uint32_t bits_ = 0;
    std::vector<Layer> layers_;
};

// A bare layer or index equals a mask only when the mask is exactly that one layer;
// a collection equals a mask when its union is the mask. C++20 supplies the reversed
// and != forms.
template <MaskOperand T>
    requires(!std::same_as<T, Mask>)
[[nodiscard]] bool operator==(const Mask& mask, const T& other) {
    return mask.bits() == Mask::bitsOf(other);
}

template <MaskOperand L, MaskOperand R>
    requires(std::same_as<L, Mask> || std::same_as<R, Mask>)
[[nodiscard]] Mask operator|(const L& left, const R& right) {
    return Mask::fromBits(Mask::bitsOf(left) | Mask::bitsOf(right));
}

// Same as |, reads better when building masks up.
template <MaskOperand L, MaskOperand R>
    requires(std::same_as<L, Mask> || std::same_as<R, Mask>)
[[nodiscard]] Mask operator+(const L& left, const R& right) {
    return left | right;
}

template <MaskOperand L, MaskOperand R>
    requires(std::same_as<L, Mask> || std::same_as<R, Mask>)
[[nodiscard]] Mask operator&(const L& left, const R& right) {
    return Mask::fromBits(Mask::bitsOf(left) & Mask::bitsOf(right));
}

// Clears every bit of right from left, whether or not left had it set.
template <MaskOperand L, MaskOperand R>
    requires(std::same_as<L, Mask> || std::same_as<R, Mask>)
[[nodiscard]] Mask operator-(const L& left, const R& right) {
    return Mask::fromBits(Mask::bitsOf(left) & ~Mask::bitsOf(right));
}

[[nodiscard]] inline Mask operator~(const Mask& mask) { return Mask::fromBits(~mask.bits()); }

std::string to_string(const Mask& mask);
std::ostream& operator<<(std::ostream& os, const Mask& mask);

void to_json(nlohmann::json& j, const Mask& mask);
void from_json(const nlohmann::json& j, Mask& mask);

}

template <>
struct std::hash<nl::layers::Mask> {
    std::size_t operator()(const nl::layers::Mask& mask) const noexcept { return mask.bits(); }
};

// "{}" prints Mask{1, 2}, "{:b}" prints the 32-digit bit string.
template <>
struct fmt::formatter<nl::layers::Mask> {
    bool bit_string = false;

    constexpr auto parse(fmt::format_parse_context& ctx) {
        auto it = ctx.begin();
        if (it != ctx.end() && *it == 'b') {
            bit_string = true;
            ++it;
        }
        if (it != ctx.end() && *it != '}') throw fmt::format_error("invalid format for Mask");
        return it;
    }

    fmt::format_context::iterator format(const nl::layers::Mask& mask, fmt::format_context& ctx) const;
};

#include "layers/ContainsQuery.hpp"
#include "layers/IsQuery.hpp"
