#include "labels/LayerNameTable.hpp"
#include "config/Config.hpp"
#include "layers/Mask.hpp"
#include "log/Registry.hpp"

#include <map>
#include <stdexcept>
#include <string_view>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

using namespace nl::labels;
using namespace nl::layers;

namespace {

constexpr std::array<const char*, LAYER_COUNT> DEFAULT_LABELS = {
    "Layer.Default",
    "Layer.TransparentFX",
    "Layer.IgnoreRaycast",
    "Layer.L3",
    "Layer.Water",
    "Layer.UI",
    "Layer.L6",
    "Layer.L7",
    "Layer.IgnoreTopDown",
    "Layer.Selectable",
    "Layer.IgnoreVR",
    "Layer.Floor",
    "Layer.Player",
    "Layer.Wall",
    "Layer.EscapeRoute",
    "Layer.TestOBJ",
    "Layer.IgnorePhysics",
    "Layer.VROnly",
    "Layer.MiniModelPreview",
    "Layer.SelectableIcon",
    "Layer.EndlessPlane",
    "Layer.ExteriorObjectBlocking",
    "Layer.L22",
    "Layer.L23",
    "Layer.L24",
    "Layer.L25",
    "Layer.L26",
    "Layer.L27",
    "Layer.L28",
    "Layer.L29",
    "Layer.L30",
    "Layer.L31",
};

// Label tables are built before logging is set up in some callers (defaults(), tests).
std::shared_ptr<spdlog::logger> labelsLog() {
    return nl::log::Registry::isInitialized() ? nl::log::Registry::labels() : nullptr;
}

}

LayerNameTable::LayerNameTable(const config::LayerLabelsConfig& cnf) {
    const auto log = labelsLog();

    if (cnf.use_default_labels)
        for (unsigned int i = 0; i < LAYER_COUNT; ++i) labels_[i] = DEFAULT_LABELS[i];

    for (const auto& [index, label] : cnf.labels) {
        const auto checked = checkedIndex(index);
        if (log) log->debug("[LayerNameTable] Layer {} labelled '{}'", checked, label);
        labels_[checked] = label;
    }

    // A label names exactly one layer.
    std::map<std::string_view, unsigned int> owners;
    for (unsigned int i = 0; i < LAYER_COUNT; ++i) {
        if (!labels_[i]) continue;
        if (const auto [it, inserted] = owners.emplace(*labels_[i], i); !inserted)
            throw std::invalid_argument(fmt::format("Label '{}' is assigned to both layer {} and layer {}",
                                                    *labels_[i], it->second, i));
    }

    if (log)
        for (unsigned int i = 0; i < LAYER_COUNT; ++i)
            if (!labels_[i]) log->warn("[LayerNameTable] No label configured for layer {}", i);
}

const LayerNameTable& LayerNameTable::defaults() {
    static const LayerNameTable table = [] {
        LayerNameTable t;
        for (unsigned int i = 0; i < LAYER_COUNT; ++i) t.labels_[i] = DEFAULT_LABELS[i];
        return t;
    }();
    return table;
}

const std::string& LayerNameTable::label(const int index) const { return labelAt(checkedIndex(index)); }

const std::string& LayerNameTable::label(const Layer layer) const { return labelAt(toIndex(layer)); }

const std::string& LayerNameTable::labelAt(const unsigned int index) const {
    const auto& entry = labels_[index];
    if (!entry) throw UnknownLayerLabel(index);
    return *entry;
}

bool LayerNameTable::hasLabel(const int index) const { return labels_[checkedIndex(index)].has_value(); }

std::size_t LayerNameTable::size() const {
    std::size_t count = 0;
    for (const auto& entry : labels_) if (entry) ++count;
    return count;
}

std::optional<Layer> LayerNameTable::find(const std::string_view label) const {
    for (unsigned int i = 0; i < LAYER_COUNT; ++i)
        if (labels_[i] && *labels_[i] == label) return static_cast<Layer>(i);
    return std::nullopt;
}

std::string LayerNameTable::describe(const Mask& mask) const {
    if (!mask.isNonEmpty()) return "<empty>";

    std::string out;
    for (const auto layer : mask) {
        if (!out.empty()) out += " | ";
        out += label(layer);
    }
    return out;
}

std::string nl::labels::to_string(const Layer layer) {
    return LayerNameTable::defaults().label(layer);
}

nlohmann::json nl::labels::jsonFromMask(const Mask& mask, const LayerNameTable& table) {
    auto j = nlohmann::json::object();
    for (unsigned int i = 0; i < LAYER_COUNT; ++i) {
        const auto layer = static_cast<Layer>(i);
        if (table.hasLabel(static_cast<int>(i))) j[table.label(layer)] = mask.contains(layer);
    }
    return j;
}
