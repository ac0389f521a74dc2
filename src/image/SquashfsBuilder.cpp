#include "image/ImageBuilder.hpp"
#include "log/Registry.hpp"

#include <cerrno>
#include <cstring>
#include <fmt/core.h>
#include <sys/wait.h>
#include <unistd.h>

using namespace masf::image;

SquashfsBuilder::SquashfsBuilder(std::string program, std::vector<std::string> args)
    : program_(std::move(program)), args_(std::move(args)) {
    if (program_.empty()) throw std::invalid_argument("SquashfsBuilder: archiver program is empty");
}

int SquashfsBuilder::build(const std::filesystem::path& stagingRoot, const std::filesystem::path& destination) {
    const std::string src = stagingRoot.string();
    const std::string dst = destination.string();

    std::vector<const char*> argv = {program_.c_str(), src.c_str(), dst.c_str()};
    for (const auto& a : args_) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    log::Registry::image()->info("[SquashfsBuilder] Running {} {} {}{}", program_, src, dst,
                                 args_.empty() ? "" : fmt::format(" ({} extra arg(s))", args_.size()));

    const pid_t pid = fork();
    if (pid < 0) throw std::runtime_error(fmt::format("Failed to fork {}: {}", program_, std::strerror(errno)));

    if (pid == 0) {
        execvp(program_.c_str(), const_cast<char* const*>(argv.data()));
        _exit(127); // exec failed
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR)
            throw std::runtime_error(fmt::format("Failed to wait for {}: {}", program_, std::strerror(errno)));
    }

    int code = 0;
    if (WIFEXITED(status)) code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) code = 128 + WTERMSIG(status);
    else code = 1;

    log::Registry::image()->info("[SquashfsBuilder] {} exited with status {}", program_, code);
    return code;
}
