#include "core/ImageMaker.hpp"
#include "image/ImageBuilder.hpp"
#include "stage/StagingDirectory.hpp"
#include "log/Registry.hpp"

#include <stdexcept>
#include <system_error>
#include <fmt/core.h>

namespace masf::core {

ImageResult makeMasfImage(const std::filesystem::path& source,
                          const std::filesystem::path& destination,
                          const rules::RuleSet& rules,
                          const ImageOptions& options,
                          image::ImageBuilder& builder) {
    std::error_code ec;
    if (!std::filesystem::is_directory(source, ec))
        throw std::invalid_argument(fmt::format("Source is not a directory: {}", source.string()));

    const stage::StagingDirectory staging(options.tempDir);

    stage::Stager stager(rules, options.staging);
    ImageResult result{stager.stage(source, staging.root()), stager.stats()};
    if (options.onStaged) options.onStaged(result);

    const int status = builder.build(staging.root(), destination);
    if (status != 0)
        throw image::ArchiveBuildError(fmt::format("Image build for {} failed with status {}",
                                                   destination.string(), status), status);

    log::Registry::masf()->info("[ImageMaker] Wrote {} ({} staging error(s))", destination.string(),
                                result.errors.size());
    return result;
}

}
