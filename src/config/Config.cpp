#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace nl::config {

template <typename T>
static void decodeSection(const YAML::Node& root, const std::string& key, T& out) {
    const auto node = root[key];
    if (!node) return;
    if (!YAML::convert<T>::decode(node, out))
        throw std::runtime_error("Invalid '" + key + "' section in configuration, expected a map");
}

static Config fromRoot(const YAML::Node& root) {
    Config cfg;
    if (!root || root.IsNull()) return cfg;
    if (!root.IsMap()) throw std::runtime_error("Configuration root must be a map");

    decodeSection(root, "logging", cfg.logging);
    decodeSection(root, "layers", cfg.layers);

    return cfg;
}

Config loadConfig(const std::filesystem::path& path) {
    return fromRoot(YAML::LoadFile(path.string()));
}

Config loadConfigFromString(const std::string& yaml) {
    return fromRoot(YAML::Load(yaml));
}

std::string dumpConfig(const Config& config) {
    YAML::Node root;
    root["logging"] = config.logging;
    root["layers"] = config.layers;

    YAML::Emitter out;
    out << root;
    return out.c_str();
}

}
