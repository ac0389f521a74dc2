#pragma once

#include "rules/RuleSet.hpp"

#include <cstdint>
#include <string_view>

namespace masf::rules {

enum class Verdict { Keep, Placeholder };

/**
 * Decides whether a file is copied in full or reduced to a placeholder.
 *
 * A satisfied extension rule (suffix match and size strictly below its limit) keeps the file
 * no matter what the global limit says. When no extension rule is satisfied the global limit
 * is consulted exactly once. All comparisons are strict, so a file at a limit is not kept by it.
 */
[[nodiscard]] Verdict classify(std::string_view relativePath, uintmax_t size, const RuleSet& rules);

std::string_view to_string(Verdict v);

}
