#include "rules/RuleSet.hpp"
#include "util/size.hpp"
#include "log/Registry.hpp"

namespace masf::rules {

ExclusionRule parseRule(const std::string& text) {
    const auto eq = text.find('=');
    if (eq == std::string::npos) throw InvalidRuleError(text, "expected EXT=SIZE");

    ExclusionRule rule;
    rule.extension = text.substr(0, eq);
    if (rule.extension.empty()) throw InvalidRuleError(text, "extension cannot be empty");

    rule.limit = util::parseSize(text.substr(eq + 1));
    return rule;
}

void RuleSet::add(const ExclusionRule& rule) {
    const auto [it, inserted] = extensions.insert_or_assign(rule.extension, rule.limit);
    if (!inserted && log::Registry::isInitialized())
        log::Registry::masf()->warn("[RuleSet] Extension '{}' given more than once, using the last limit ({} bytes)",
                                    rule.extension, rule.limit);
}

RuleSet RuleSet::fromArgs(const std::vector<std::string>& rules, const std::string& globalLimit) {
    std::vector<ExclusionRule> parsed;
    parsed.reserve(rules.size());
    for (const auto& r : rules) parsed.push_back(parseRule(r));

    RuleSet set;
    set.globalLimit = util::parseSize(globalLimit);
    for (const auto& r : parsed) set.add(r);
    return set;
}

}
