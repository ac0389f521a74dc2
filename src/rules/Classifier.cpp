#include "rules/Classifier.hpp"

namespace masf::rules {

Verdict classify(const std::string_view relativePath, const uintmax_t size, const RuleSet& rules) {
    for (const auto& [extension, limit] : rules.extensions)
        if (relativePath.ends_with(extension) && size < limit) return Verdict::Keep;

    return size < rules.globalLimit ? Verdict::Keep : Verdict::Placeholder;
}

std::string_view to_string(const Verdict v) {
    switch (v) {
    case Verdict::Keep: return "keep";
    case Verdict::Placeholder: return "placeholder";
    }
    return "unknown";
}

}
