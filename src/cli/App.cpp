#include "cli/App.hpp"
#include "cli/Parser.hpp"
#include "cli/Token.hpp"
#include "config/ConfigRegistry.hpp"
#include "core/ImageMaker.hpp"
#include "image/ImageBuilder.hpp"
#include "log/Registry.hpp"
#include "rules/RuleSet.hpp"
#include "util/size.hpp"

#include <limits>
#include <memory>
#include <optional>
#include <unordered_set>
#include <vector>
#include <fmt/core.h>

namespace masf::cli {

static const std::unordered_set<std::string> VALUE_KEYS = {"g", "global-limit", "j", "jobs", "c", "config"};
static const std::unordered_set<std::string> KNOWN_KEYS = {
    "s", "store-filesizes", "g", "global-limit", "j", "jobs", "c", "config", "v", "verbose", "h", "help"
};

static const std::vector<std::string> HELP = {"h", "help"};
static const std::vector<std::string> STORE_FILESIZES = {"s", "store-filesizes"};
static const std::vector<std::string> GLOBAL_LIMIT = {"g", "global-limit"};
static const std::vector<std::string> JOBS = {"j", "jobs"};
static const std::vector<std::string> CONFIG = {"c", "config"};
static const std::vector<std::string> VERBOSE = {"v", "verbose"};

static CommandResult invalid(const std::string& msg) {
    return {2, "", fmt::format("mkmasfimage: error: {}\n{}", msg, usage())};
}

static CommandResult failed(const std::string& msg) {
    return {1, "", fmt::format("mkmasfimage: {}\n", msg)};
}

static std::optional<unsigned int> parseUInt(const std::string& sv) {
    if (sv.empty()) return std::nullopt;

    unsigned long long v = 0; // wide enough for overflow check
    for (const char c : sv) {
        if (c < '0' || c > '9') return std::nullopt;
        v = v * 10 + static_cast<unsigned>(c - '0');
        if (v > std::numeric_limits<unsigned int>::max()) return std::nullopt;
    }

    return static_cast<unsigned int>(v);
}

std::string usage() {
    return
        "usage: mkmasfimage [-h] [-s] [-g SIZE] [-j N] [-c FILE] [-v] [rule ...] source destination\n"
        "\n"
        "Create a MASF (Metadata and Small Files) image.\n"
        "\n"
        "positional arguments:\n"
        "  rule                  exclusion rules, in the format of EXT=SIZE where EXT is the\n"
        "                        extension of the file (e.g. \".txt\") and SIZE is the maximum\n"
        "                        size allowed for these type of files\n"
        "  source                source folder\n"
        "  destination           image file to create\n"
        "\n"
        "options:\n"
        "  -h, --help            show this help message and exit\n"
        "  -s, --store-filesizes include the sizes of the files, slows down the image\n"
        "                        creation process considerably\n"
        "  -g, --global-limit SIZE\n"
        "                        file size limit for the non-excluded files (default: 0)\n"
        "  -j, --jobs N          number of files staged in parallel\n"
        "  -c, --config FILE     YAML configuration file\n"
        "  -v, --verbose         log every staging decision\n"
        "\n"
        "For the size values, units k and M are supported\n";
}

CommandCall parseArgs(const std::vector<std::string>& args) {
    return parseTokens("mkmasfimage", tokenize(args, VALUE_KEYS), VALUE_KEYS);
}

static std::string formatSummary(const core::ImageResult& r, const std::string& destination) {
    const auto& s = r.stats;
    return fmt::format("{}: {} kept ({}), {} placeholders ({} omitted), {} symlinks, {} special, {} directories, {} error(s)\n",
                       destination, s.kept, util::bytesToSize(s.bytesKept), s.placeholders,
                       util::bytesToSize(s.bytesOmitted), s.symlinks, s.special, s.directories, r.errors.size());
}

CommandResult run(const std::vector<std::string>& args, image::ImageBuilder* builder) {
    const auto call = parseArgs(args);

    if (hasKey(call, HELP)) return {0, usage(), ""};

    for (const auto& [key, value] : call.options) {
        if (!KNOWN_KEYS.contains(key))
            return invalid(fmt::format("unrecognized option '{}{}'", key.size() == 1 ? "-" : "--", key));
        if (VALUE_KEYS.contains(key) && !value)
            return invalid(fmt::format("option '{}{}' expects a value", key.size() == 1 ? "-" : "--", key));
    }

    if (call.positionals.size() < 2) return invalid("the following arguments are required: source, destination");

    const std::vector<std::string> ruleArgs(call.positionals.begin(), call.positionals.end() - 2);
    const std::string source = call.positionals[call.positionals.size() - 2];
    const std::string destination = call.positionals.back();

    std::optional<unsigned int> jobs;
    if (const auto j = optVal(call, JOBS)) {
        jobs = parseUInt(*j);
        if (!jobs || *jobs == 0) return invalid(fmt::format("invalid job count: {}", *j));
    }

    // Size and rule errors are usage errors and win over anything the config could report.
    std::vector<rules::ExclusionRule> parsedRules;
    rules::RuleSet ruleSet;
    try {
        for (const auto& r : ruleArgs) parsedRules.push_back(rules::parseRule(r));
        ruleSet.globalLimit = util::parseSize(optVal(call, GLOBAL_LIMIT).value_or("0"));
    } catch (const std::invalid_argument& e) {
        return invalid(e.what());
    }

    try {
        if (const auto path = optVal(call, CONFIG)) config::ConfigRegistry::init(std::filesystem::path(*path));
        else config::ConfigRegistry::init();

        log::Registry::init();
        if (hasKey(call, VERBOSE)) log::Registry::setConsoleLevel(spdlog::level::debug);
    } catch (const std::exception& e) {
        return failed(e.what());
    }

    if (const auto& loaded = config::ConfigRegistry::source())
        log::Registry::config()->debug("[App] Loaded config from {}", loaded->string());
    else log::Registry::config()->debug("[App] No config file, using built-in defaults");

    // Added only now so that duplicate extensions are warned about on a live logger.
    for (const auto& r : parsedRules) ruleSet.add(r);

    const auto& cfg = config::ConfigRegistry::get();

    core::ImageOptions options;
    options.staging.storeFileSizes = hasKey(call, STORE_FILESIZES);
    options.staging.jobs = jobs.value_or(cfg.staging.jobs);
    options.tempDir = cfg.staging.temp_dir;

    CommandResult result;

    // Staging errors are reported before the archiver runs, so a failing archiver cannot hide them.
    options.onStaged = [&result](const core::ImageResult& staged) {
        for (const auto& e : staged.errors.entries())
            result.stderr_text += fmt::format("{}: {}\n", e.path.string(), e.cause);
    };

    std::unique_ptr<image::ImageBuilder> owned;
    try {
        if (!builder) {
            owned = std::make_unique<image::SquashfsBuilder>(cfg.image.archiver, cfg.image.archiver_args);
            builder = owned.get();
        }

        const auto made = core::makeMasfImage(source, destination, ruleSet, options, *builder);
        result.stdout_text = formatSummary(made, destination);
    } catch (const std::exception& e) {
        log::Registry::masf()->info("[App] Aborted: {}", e.what());
        auto fatal = failed(e.what());
        fatal.stderr_text = result.stderr_text + fatal.stderr_text;
        return fatal;
    }

    return result;
}

}
