#pragma once

#include "rules/RuleSet.hpp"
#include "stage/ErrorLog.hpp"
#include "stage/Stager.hpp"

#include <filesystem>
#include <functional>

namespace masf::image { class ImageBuilder; }

namespace masf::core {

struct ImageResult {
    stage::ErrorLog errors;
    stage::StageStats stats;
};

struct ImageOptions {
    stage::StageOptions staging;
    std::filesystem::path tempDir;  // parent of the staging directory, empty for the system default

    // Called once staging is done and before the archiver runs, whatever the archiver does later.
    std::function<void(const ImageResult&)> onStaged;
};

/**
 * Stages `source` according to `rules` into a private temporary directory, hands that
 * directory to `builder` exactly once and removes it again on every exit path.
 *
 * Per-file staging failures are returned, not thrown, and handed to `options.onStaged`
 * before the archiver starts. A non-zero archiver status throws image::ArchiveBuildError; a source that is not a directory throws std::invalid_argument
 * before anything is created.
 */
ImageResult makeMasfImage(const std::filesystem::path& source,
                          const std::filesystem::path& destination,
                          const rules::RuleSet& rules,
                          const ImageOptions& options,
                          image::ImageBuilder& builder);

}
