#pragma once

#include "cli/Token.hpp"
#include "cli/types.hpp"

#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace masf::cli {

// Upsert a flag (last wins)
inline void setOpt(CommandCall& c,
                   const std::string& key,
                   const std::optional<std::string>& val) {
    for (auto& [k, v] : c.options) if (k == key) { v = val; return; }
    c.options.push_back(FlagKV{key, val});
}

// Only keys in `valueKeys` consume the following word; every other flag is boolean.
inline CommandCall parseTokens(const std::string& name,
                               const std::vector<Token>& toks,
                               const std::unordered_set<std::string>& valueKeys) {
    CommandCall call;
    call.name = name;
    call.options.reserve(8);
    call.positionals.reserve(8);

    bool stop_flags = false;

    for (size_t i = 0; i < toks.size(); ++i) {
        const Token& t = toks[i];

        if (!stop_flags && t.type == TokenType::Word && t.text == "--") {
            stop_flags = true;
            continue;
        }

        if (!stop_flags && t.type == TokenType::Flag) {
            if (valueKeys.contains(t.text) && i + 1 < toks.size() && toks[i + 1].type == TokenType::Word) {
                setOpt(call, t.text, toks[i + 1].text);
                ++i; // consumed value
            } else {
                setOpt(call, t.text, std::nullopt);
            }
            continue;
        }

        call.positionals.push_back(t.text);
    }

    return call;
}

inline std::optional<std::string> optVal(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.options) if (k == key) return v;
    return std::nullopt;
}

inline std::optional<std::string> optVal(const CommandCall& c, const std::vector<std::string>& keys) {
    for (const auto& k : keys) if (const auto v = optVal(c, k)) return v;
    return std::nullopt;
}

[[nodiscard]] inline bool hasKey(const CommandCall& c, const std::string& key) {
    for (const auto& kv : c.options) if (kv.key == key) return true;
    return false;
}

[[nodiscard]] inline bool hasKey(const CommandCall& c, const std::vector<std::string>& keys) {
    for (const auto& k : keys) if (hasKey(c, k)) return true;
    return false;
}

}
