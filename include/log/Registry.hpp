#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace masf::log {

class Registry {
public:
    // Builds every subsystem logger from ConfigRegistry. A second call is ignored.
    static void init();

    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    static std::shared_ptr<spdlog::logger> masf()   { return get("masf"); }
    static std::shared_ptr<spdlog::logger> walker() { return get("walker"); }
    static std::shared_ptr<spdlog::logger> stager() { return get("stager"); }
    static std::shared_ptr<spdlog::logger> image()  { return get("image"); }
    static std::shared_ptr<spdlog::logger> config() { return get("config"); }

    // Lowers (or raises) the console threshold after init, e.g. for --verbose.
    static void setConsoleLevel(spdlog::level::level_enum level);

    [[nodiscard]] static bool isInitialized();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;
};

}
