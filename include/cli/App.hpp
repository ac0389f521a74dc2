#pragma once

#include "cli/types.hpp"

#include <string>
#include <vector>

namespace masf::image { class ImageBuilder; }

namespace masf::cli {

std::string usage();

CommandCall parseArgs(const std::vector<std::string>& args);

/**
 * Runs mkmasfimage with already split arguments (argv without the program name).
 * When `builder` is null the archiver from the config is used.
 */
CommandResult run(const std::vector<std::string>& args, image::ImageBuilder* builder = nullptr);

}
