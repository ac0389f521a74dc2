#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace masf::util {

static constexpr uintmax_t KILOBYTE = 1024;
static constexpr uintmax_t MEGABYTE = KILOBYTE * KILOBYTE;

struct InvalidSizeError : std::invalid_argument {
    explicit InvalidSizeError(const std::string& text)
        : std::invalid_argument("Invalid size: " + text), text(text) {}

    std::string text;  // the offending input, verbatim
};

// "<digits>", "<digits>k" (x1024) or "<digits>M" (x1048576). Anything else throws InvalidSizeError.
uintmax_t parseSize(const std::string& s);

std::string bytesToSize(uintmax_t bytes);

}
