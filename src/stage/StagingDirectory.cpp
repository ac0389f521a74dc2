#include "stage/StagingDirectory.hpp"
#include "log/Registry.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>
#include <fmt/core.h>
#include <sys/stat.h>

namespace masf::stage {

namespace fs = std::filesystem;

StagingDirectory::StagingDirectory(const fs::path& parent) {
    const fs::path dir = parent.empty() ? fs::temp_directory_path() : parent;

    std::string tmpl = (dir / "masf-XXXXXX").string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    if (!::mkdtemp(buf.data()))
        throw std::runtime_error(fmt::format("Failed to create staging directory in {}: {}",
                                             dir.string(), std::strerror(errno)));

    base_ = buf.data();
    root_ = base_ / "image";

    std::error_code ec;
    fs::create_directory(root_, ec);
    if (ec) {
        fs::remove_all(base_, ec);
        throw std::runtime_error(fmt::format("Failed to create staging root {}: {}", root_.string(), ec.message()));
    }

    log::Registry::stager()->debug("[StagingDirectory] Created {}", base_.string());
}

StagingDirectory::~StagingDirectory() { remove(); }

// Staged directories carry the source's permission bits; read-only ones must be opened up
// before their contents can be unlinked.
static void makeTreeWritable(const fs::path& base) {
    std::error_code ec;
    ::chmod(base.c_str(), S_IRWXU);
    for (fs::recursive_directory_iterator it(base, fs::directory_options::skip_permission_denied, ec), end;
         !ec && it != end; it.increment(ec)) {
        if (it->is_directory(ec) && !it->is_symlink(ec)) ::chmod(it->path().c_str(), S_IRWXU);
    }
}

bool StagingDirectory::remove() noexcept {
    if (removed_ || base_.empty()) return true;

    try {
        std::error_code ec;
        fs::remove_all(base_, ec);
        if (ec) {
            makeTreeWritable(base_);
            ec.clear();
            fs::remove_all(base_, ec);
        }

        if (ec) {
            log::Registry::stager()->error("[StagingDirectory] Failed to remove {}: {}", base_.string(), ec.message());
            return false;
        }

        removed_ = true;
        log::Registry::stager()->debug("[StagingDirectory] Removed {}", base_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("[StagingDirectory] Failed to remove {}: {}", base_.string(), e.what());
        return false;
    }
}

}
