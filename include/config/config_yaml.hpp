#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace masf::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

static spdlog::level::level_enum levelOrDefault(const Node& node, const spdlog::level::level_enum def) {
    if (!node) return def;
    return spdlog::level::from_str(node.as<std::string>());
}

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["masf"]   = to_std_string(spdlog::level::to_string_view(rhs.masf));
        node["walker"] = to_std_string(spdlog::level::to_string_view(rhs.walker));
        node["stager"] = to_std_string(spdlog::level::to_string_view(rhs.stager));
        node["image"]  = to_std_string(spdlog::level::to_string_view(rhs.image));
        node["config"] = to_std_string(spdlog::level::to_string_view(rhs.config));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.masf   = levelOrDefault(node["masf"], spdlog::level::info);
        rhs.walker = levelOrDefault(node["walker"], spdlog::level::warn);
        rhs.stager = levelOrDefault(node["stager"], spdlog::level::info);
        rhs.image  = levelOrDefault(node["image"], spdlog::level::info);
        rhs.config = levelOrDefault(node["config"], spdlog::level::warn);
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["console_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_level));
        node["file_level"] = to_std_string(spdlog::level::to_string_view(rhs.file_level));
        node["log_dir"] = rhs.log_dir.string();
        node["subsystem_levels"] = convert<SubsystemLogLevelsConfig>::encode(rhs.subsystem_levels);
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_level = levelOrDefault(node["console_level"], spdlog::level::warn);
        rhs.file_level = levelOrDefault(node["file_level"], spdlog::level::info);
        rhs.log_dir = node["log_dir"].as<std::string>("");
        if (node["subsystem_levels"])
            convert<SubsystemLogLevelsConfig>::decode(node["subsystem_levels"], rhs.subsystem_levels);
        return true;
    }
};

template<>
struct convert<ImageConfig> {
    static Node encode(const ImageConfig& rhs) {
        Node node;
        node["archiver"] = rhs.archiver;
        node["archiver_args"] = rhs.archiver_args;
        return node;
    }

    static bool decode(const Node& node, ImageConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.archiver = node["archiver"].as<std::string>("mksquashfs");
        rhs.archiver_args = node["archiver_args"].as<std::vector<std::string>>(std::vector<std::string>{});
        return true;
    }
};

template<>
struct convert<StagingConfig> {
    static Node encode(const StagingConfig& rhs) {
        Node node;
        node["temp_dir"] = rhs.temp_dir.string();
        node["jobs"] = rhs.jobs;
        return node;
    }

    static bool decode(const Node& node, StagingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.temp_dir = node["temp_dir"].as<std::string>("");
        if (node["jobs"]) rhs.jobs = node["jobs"].as<unsigned int>();
        if (rhs.jobs == 0) rhs.jobs = 1;
        return true;
    }
};

} // namespace YAML
