#include "config/ConfigRegistry.hpp"

#include <stdexcept>
#include <system_error>

namespace masf::config {

void ConfigRegistry::init(const std::optional<std::filesystem::path>& path) {
    std::optional<std::filesystem::path> from = path;
    if (!from) {
        std::error_code ec;
        if (std::filesystem::exists(DEFAULT_CONFIG_PATH, ec)) from = DEFAULT_CONFIG_PATH;
    }

    config_ = from ? loadConfig(*from) : Config{};
    source_ = std::move(from);
    initialized_ = true;
}

void ConfigRegistry::set(Config config) {
    config_ = std::move(config);
    source_.reset();
    initialized_ = true;
}

const Config& ConfigRegistry::get() {
    ensureInitialized();
    return config_;
}

const std::optional<std::filesystem::path>& ConfigRegistry::source() { return source_; }

void ConfigRegistry::ensureInitialized() {
    if (!initialized_)
        throw std::runtime_error("ConfigRegistry accessed before initialization. Call ConfigRegistry::init() first.");
}

} // namespace masf::config
