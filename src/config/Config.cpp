#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <stdexcept>
#include <yaml-cpp/yaml.h>
#include <fmt/core.h>

namespace masf::config {

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    YAML::Node root;

    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(fmt::format("Failed to load config file {}: {}", path.string(), e.what()));
    }

    if (!root || root.IsNull()) return cfg;
    if (!root.IsMap()) throw std::runtime_error(fmt::format("Config file {} is not a YAML mapping", path.string()));

    try {
        if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);
        if (auto node = root["image"]) YAML::convert<ImageConfig>::decode(node, cfg.image);
        if (auto node = root["staging"]) YAML::convert<StagingConfig>::decode(node, cfg.staging);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(fmt::format("Invalid value in config file {}: {}", path.string(), e.what()));
    }

    return cfg;
}

} // namespace masf::config
