#pragma once

#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace masf::cli {

enum class TokenType { Word, Flag };

struct Token {
    TokenType type;
    std::string text;
};

inline bool looks_negative_number(std::string_view s) {
    if (s.size() < 2 || s[0] != '-') return false;
    bool dot = false, digit = false;
    for (size_t i = 1; i < s.size(); ++i) {
        const char c = s[i];
        if (c >= '0' && c <= '9') { digit = true; continue; }
        if (c == '.' && !dot) { dot = true; continue; }
        return false;
    }
    return digit;
}

inline void pushFlag(std::vector<Token>& out, std::string k) {
    out.push_back({TokenType::Flag, std::move(k)});
}
inline void pushWord(std::vector<Token>& out, std::string v) {
    out.push_back({TokenType::Word, std::move(v)});
}

// Expand short bundle "-sv" -> flags s,v. A short option that takes a value swallows the rest ("-g10k").
inline void expand_bundle(std::string_view bundle, const std::unordered_set<std::string>& valueKeys,
                          std::vector<Token>& out) {
    for (size_t i = 0; i < bundle.size(); ++i) {
        std::string key(1, bundle[i]);
        const bool takesValue = valueKeys.contains(key);
        pushFlag(out, std::move(key));
        if (takesValue && i + 1 < bundle.size()) {
            pushWord(out, std::string(bundle.substr(i + 1)));
            return;
        }
    }
}

// argv is already split by the shell; this only classifies and splits the words.
inline std::vector<Token> tokenize(const std::vector<std::string>& args,
                                   const std::unordered_set<std::string>& valueKeys) {
    std::vector<Token> out;
    out.reserve(args.size() + 4);

    bool stop_flags = false;
    for (const auto& a : args) {
        if (stop_flags || a.size() < 2 || a[0] != '-' || looks_negative_number(a)) {
            pushWord(out, a);
            continue;
        }

        if (a == "--") {
            pushWord(out, a);
            stop_flags = true;
            continue;
        }

        if (a[1] == '-') {
            const std::string_view body = std::string_view(a).substr(2);
            if (const auto eq = body.find('='); eq != std::string_view::npos) {
                pushFlag(out, std::string(body.substr(0, eq)));
                pushWord(out, std::string(body.substr(eq + 1)));
            } else pushFlag(out, std::string(body));
            continue;
        }

        expand_bundle(std::string_view(a).substr(1), valueKeys, out);
    }

    return out;
}

}
