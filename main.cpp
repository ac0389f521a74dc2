#include "cli/App.hpp"

#include <string>
#include <vector>
#include <fmt/core.h>

int main(const int argc, char** argv) {
    const std::vector<std::string> args(argv + 1, argv + argc);

    const auto r = masf::cli::run(args);
    if (!r.stderr_text.empty()) fmt::print(stderr, "{}", r.stderr_text);
    if (!r.stdout_text.empty()) fmt::print("{}", r.stdout_text);
    return r.exit_code;
}
