#include "layers/Mask.hpp"
#include "util/bitmask.hpp"

#include <bit>
#include <cstdint>
#include <stdexcept>
#include <vector>
#include <nlohmann/json.hpp>

using namespace nl::layers;

Mask::Mask(RawBits, const uint32_t bits) : bits_(bits) {
    layers_.reserve(static_cast<std::size_t>(std::popcount(bits)));
    for (unsigned int i = 0; i < LAYER_COUNT; ++i)
        if (bits & (1u << i)) layers_.push_back(static_cast<Layer>(i));
}

Mask Mask::fromBits(const uint32_t bits) { return {RawBits{}, bits}; }

Mask Mask::fromLayer(const int layer) { return Mask(layer); }

const Mask& Mask::allLayers() {
    static const Mask all = fromBits(0xFFFFFFFFu);
    return all;
}

ContainsQuery Mask::contains() const { return ContainsQuery(*this); }

IsQuery Mask::is() const { return IsQuery(*this); }

std::string nl::layers::to_string(const Mask& mask) {
    std::string out = "Mask{";
    for (auto it = mask.begin(); it != mask.end(); ++it) {
        if (it != mask.begin()) out += ", ";
        out += std::to_string(toIndex(*it));
    }
    out += "}";
    return out;
}

std::ostream& nl::layers::operator<<(std::ostream& os, const Mask& mask) {
    return os << to_string(mask);
}

void nl::layers::to_json(nlohmann::json& j, const Mask& mask) {
    std::vector<unsigned int> indices;
    indices.reserve(mask.layerCount());
    for (const auto layer : mask) indices.push_back(toIndex(layer));

    j = {
        {"bits", mask.bits()},
        {"layers", indices}
    };
}

// Indices are range-checked at their full JSON width, never narrowed first.
static uint32_t bitsFromLayerArray(const nlohmann::json& layers) {
    if (!layers.is_array()) throw std::invalid_argument("Mask JSON 'layers' must be an array of layer indices");

    uint32_t bits = 0;
    for (const auto& entry : layers) {
        if (!entry.is_number_integer())
            throw std::invalid_argument("Mask JSON layer index must be an integer, got " + entry.dump());

        if (entry.is_number_unsigned()) bits |= 1u << checkedIndex(entry.get<std::uint64_t>());
        else bits |= 1u << checkedIndex(entry.get<std::int64_t>());
    }
    return bits;
}

static uint32_t bitsFromPattern(const nlohmann::json& bits) {
    if (!bits.is_number_unsigned() || bits.get<std::uint64_t>() > UINT32_MAX)
        throw std::out_of_range("Mask JSON 'bits' must be an unsigned 32-bit pattern, got " + bits.dump());
    return static_cast<uint32_t>(bits.get<std::uint64_t>());
}

void nl::layers::from_json(const nlohmann::json& j, Mask& mask) {
    if (j.contains("layers")) mask = Mask::fromBits(bitsFromLayerArray(j.at("layers")));
    else if (j.contains("bits")) mask = Mask::fromBits(bitsFromPattern(j.at("bits")));
    else throw std::invalid_argument("Mask JSON requires either 'layers' or 'bits'");
}

fmt::format_context::iterator fmt::formatter<Mask>::format(const Mask& mask, fmt::format_context& ctx) const {
    if (bit_string) return fmt::format_to(ctx.out(), "{}", nl::util::bitmask::bitStringFromMask(mask.bits()));
    return fmt::format_to(ctx.out(), "{}", nl::layers::to_string(mask));
}
