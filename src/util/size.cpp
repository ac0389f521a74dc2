#include "util/size.hpp"

#include <array>
#include <cmath>
#include <limits>
#include <fmt/core.h>

namespace masf::util {

uintmax_t parseSize(const std::string& s) {
    if (s.empty()) throw InvalidSizeError(s);

    uintmax_t multiplier = 1;
    std::string digits = s;
    switch (s.back()) {
    case 'k': multiplier = KILOBYTE; digits.pop_back(); break;
    case 'M': multiplier = MEGABYTE; digits.pop_back(); break;
    default: break;
    }

    if (digits.empty()) throw InvalidSizeError(s);

    uintmax_t v = 0;
    for (const char c : digits) {
        if (c < '0' || c > '9') throw InvalidSizeError(s);
        const auto d = static_cast<uintmax_t>(c - '0');
        if (v > (std::numeric_limits<uintmax_t>::max() - d) / 10) throw InvalidSizeError(s);
        v = v * 10 + d;
    }

    if (v > std::numeric_limits<uintmax_t>::max() / multiplier) throw InvalidSizeError(s);
    return v * multiplier;
}

std::string bytesToSize(const uintmax_t bytes) {
    static constexpr std::array<const char*, 5> suffix = {"B", "KB", "MB", "GB", "TB"};

    if (bytes < 1024) return std::to_string(bytes) + "B";

    auto value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < suffix.size()) {
        value /= 1024.0;
        ++unit;
    }

    if (value >= 100.0 || std::fabs(value - std::round(value)) < 0.05)
        return fmt::format("{:.0f}{}", value, suffix[unit]);
    return fmt::format("{:.1f}{}", value, suffix[unit]);
}

}
