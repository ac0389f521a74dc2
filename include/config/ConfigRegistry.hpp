#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <optional>

namespace masf::config {

class ConfigRegistry {
public:
    // Loads from the given file, or from DEFAULT_CONFIG_PATH when it exists, else keeps defaults.
    static void init(const std::optional<std::filesystem::path>& path = std::nullopt);

    // Installs an already built config (tests, CLI overrides).
    static void set(Config config);

    static const Config& get();

    // The file the current config came from, empty when built-in or set() defaults are in use.
    static const std::optional<std::filesystem::path>& source();

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline std::optional<std::filesystem::path> source_;
    static inline bool initialized_ = false;
};

} // namespace masf::config
