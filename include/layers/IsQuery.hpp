#pragma once

#include "layers/Mask.hpp"

namespace nl::layers {

// Identity checks over a mask. exactly() compares against the union of all candidates,
// any() and none() compare against each candidate on its own.
// Holds a reference to the mask; do not keep it past the mask's lifetime.
class IsQuery {
public:
    explicit IsQuery(const Mask& mask) noexcept : mask_(mask) {}

    template <MaskOperand... Ts>
    [[nodiscard]] bool exactly(const Ts&... candidates) const {
        return mask_.bits() == (Mask::bitsOf(candidates) | ... | 0u);
    }

    template <MaskOperand... Ts>
    [[nodiscard]] bool any(const Ts&... candidates) const { return ((mask_ == candidates) | ... | false); }

    template <MaskOperand... Ts>
    [[nodiscard]] bool notExactly(const Ts&... candidates) const { return !exactly(candidates...); }

    template <MaskOperand... Ts>
    [[nodiscard]] bool none(const Ts&... candidates) const { return !any(candidates...); }

private:
    const Mask& mask_;
};

template <MaskOperand... Ts>
    requires(sizeof...(Ts) > 0)
bool Mask::is(const Ts&... candidates) const {
    return IsQuery(*this).exactly(candidates...);
}

}
