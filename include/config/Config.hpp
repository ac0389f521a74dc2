#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace masf::config {

static constexpr auto DEFAULT_CONFIG_PATH = "/etc/masf/config.yaml";

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum masf    = spdlog::level::info;   // Run start/finish, summary
    spdlog::level::level_enum walker  = spdlog::level::warn;   // Unreadable directories
    spdlog::level::level_enum stager  = spdlog::level::info;   // Per-file failures
    spdlog::level::level_enum image   = spdlog::level::info;   // Archiver invocation and status
    spdlog::level::level_enum config  = spdlog::level::warn;
};

struct LoggingConfig {
    spdlog::level::level_enum console_level = spdlog::level::warn;
    spdlog::level::level_enum file_level = spdlog::level::info;
    std::filesystem::path log_dir;  // empty: console only
    SubsystemLogLevelsConfig subsystem_levels;
};

struct ImageConfig {
    std::string archiver = "mksquashfs";
    std::vector<std::string> archiver_args;
};

struct StagingConfig {
    std::filesystem::path temp_dir;  // empty: system temp directory
    unsigned int jobs = 1;
};

struct Config {
    LoggingConfig logging;
    ImageConfig image;
    StagingConfig staging;
};

Config loadConfig(const std::filesystem::path& path);

} // namespace masf::config
