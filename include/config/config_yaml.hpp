#pragma once

#include "config/Config.hpp"
#include "config/util.hpp"
#include "layers/Layer.hpp"

#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace nl::config;

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["noxlayers"] = logLevelToString(rhs.noxlayers);
        node["config"]    = logLevelToString(rhs.config);
        node["labels"]    = logLevelToString(rhs.labels);
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.noxlayers = parseLogLevel(node["noxlayers"].as<std::string>("info"));
        rhs.config = parseLogLevel(node["config"].as<std::string>("warn"));
        rhs.labels = parseLogLevel(node["labels"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["console_level"] = logLevelToString(rhs.console_log_level);
        node["file_level"] = logLevelToString(rhs.file_log_level);
        if (rhs.file) node["file"] = rhs.file->string();
        node["subsystems"] = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = parseLogLevel(node["console_level"].as<std::string>("info"));
        rhs.file_log_level = parseLogLevel(node["file_level"].as<std::string>("warn"));
        if (node["file"]) rhs.file = node["file"].as<std::string>();
        if (node["subsystems"]) rhs.subsystem_levels = node["subsystems"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LayerLabelsConfig> {
    static Node encode(const LayerLabelsConfig& rhs) {
        Node node;
        node["use_default_labels"] = rhs.use_default_labels;
        for (const auto& [index, label] : rhs.labels) node["labels"][index] = label;
        return node;
    }

    static bool decode(const Node& node, LayerLabelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.use_default_labels = node["use_default_labels"].as<bool>(true);
        rhs.labels.clear();

        if (const auto labels = node["labels"]) {
            if (!labels.IsMap()) return false;
            for (const auto& entry : labels) {
                const auto index = nl::layers::checkedIndex(entry.first.as<int>());
                rhs.labels[index] = entry.second.as<std::string>();
            }
        }
        return true;
    }
};

}
