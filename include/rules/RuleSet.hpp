#pragma once

#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace masf::rules {

struct InvalidRuleError : std::invalid_argument {
    explicit InvalidRuleError(const std::string& rule, const std::string& reason)
        : std::invalid_argument("Invalid rule '" + rule + "': " + reason) {}
};

// Files whose path ends with `extension` are kept in full when strictly smaller than `limit`.
struct ExclusionRule {
    std::string extension;
    uintmax_t limit = 0;
};

struct RuleSet {
    std::map<std::string, uintmax_t> extensions;
    uintmax_t globalLimit = 0;

    // Rules are validated before the global limit. Later rules for an already seen extension
    // replace the earlier ones.
    static RuleSet fromArgs(const std::vector<std::string>& rules, const std::string& globalLimit = "0");

    void add(const ExclusionRule& rule);
};

// Splits "EXT=SIZE" on the first '='.
ExclusionRule parseRule(const std::string& text);

}
