#include "log/Registry.hpp"
#include "config/ConfigRegistry.hpp"

#include <stdexcept>
#include <vector>

namespace masf::log {

void Registry::init() {
    if (initialized_) {
        spdlog::debug("[Registry] Already initialized, ignoring second init()");
        return;
    }

    const auto& cnf = config::ConfigRegistry::get().logging;

    console_sink_ = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink_->set_level(cnf.console_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    std::vector<spdlog::sink_ptr> sinks{console_sink_};

    if (!cnf.log_dir.empty()) {
        namespace fs = std::filesystem;
        if (!fs::exists(cnf.log_dir)) fs::create_directories(cnf.log_dir);

        main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            (cnf.log_dir / "mkmasfimage.log").string(), main_max_bytes_, main_max_files_);
        main_file_sink_->set_level(cnf.file_level);
        main_file_sink_->set_pattern(LOG_FORMAT);
        sinks.push_back(main_file_sink_);
    }

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        if (spdlog::get(name)) spdlog::drop(name);
        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.subsystem_levels;
    makeLogger("masf",   sub_levels.masf);
    makeLogger("walker", sub_levels.walker);
    makeLogger("stager", sub_levels.stager);
    makeLogger("image",  sub_levels.image);
    makeLogger("config", sub_levels.config);

    initialized_ = true;
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[Registry] Registry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[Registry] Logger not found: " + name);
    }
    return logger;
}

void Registry::setConsoleLevel(const spdlog::level::level_enum level) {
    if (!initialized_) return;
    console_sink_->set_level(level);
    // A subsystem logger filters before its sinks do, so let debug through where asked for.
    if (level < spdlog::level::info)
        spdlog::apply_all([level](const std::shared_ptr<spdlog::logger>& lg) {
            if (lg->level() > level) lg->set_level(level);
        });
}

bool Registry::isInitialized() { return initialized_; }

}
