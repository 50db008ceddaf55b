#pragma once

#include "layers/Layer.hpp"

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <nlohmann/json_fwd.hpp>

namespace nl::config {
struct LayerLabelsConfig;
}

namespace nl::layers {
class Mask;
}

namespace nl::labels {

// Display names for the 32 layers. Diagnostics only; masks never consult it.
class LayerNameTable {
public:
    // Empty table, every lookup throws UnknownLayerLabel.
    LayerNameTable() = default;

    // Starts from the built-in names when use_default_labels is set, then applies overrides.
    // Throws std::invalid_argument when two layers end up with the same label.
    explicit LayerNameTable(const config::LayerLabelsConfig& cnf);

    static const LayerNameTable& defaults();

    // Throws OutOfRangeLayer for an index outside [0, 31], UnknownLayerLabel when no label is set.
    [[nodiscard]] const std::string& label(int index) const;
    [[nodiscard]] const std::string& label(layers::Layer layer) const;

    [[nodiscard]] bool hasLabel(int index) const;
    [[nodiscard]] std::size_t size() const;

    [[nodiscard]] std::optional<layers::Layer> find(std::string_view label) const;

    // "Layer.Water | Layer.UI", or "<empty>"
    [[nodiscard]] std::string describe(const layers::Mask& mask) const;

private:
    std::array<std::optional<std::string>, layers::LAYER_COUNT> labels_;

    const std::string& labelAt(unsigned int index) const;
};

std::string to_string(layers::Layer layer);

// { "<label>": bool } for every labelled layer, the way permission masks are exported.
nlohmann::json jsonFromMask(const layers::Mask& mask, const LayerNameTable& table);

}
