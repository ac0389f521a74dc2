#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace masf::image {

struct ArchiveBuildError : std::runtime_error {
    ArchiveBuildError(const std::string& what, const int status) : std::runtime_error(what), status(status) {}
    int status;
};

// Turns a fully staged directory into an image file. Returns the archiver's exit status.
class ImageBuilder {
public:
    virtual ~ImageBuilder() = default;
    virtual int build(const std::filesystem::path& stagingRoot, const std::filesystem::path& destination) = 0;
};

// Runs `<program> <stagingRoot> <destination> [args...]` and waits for it.
class SquashfsBuilder final : public ImageBuilder {
public:
    explicit SquashfsBuilder(std::string program = "mksquashfs", std::vector<std::string> args = {});

    int build(const std::filesystem::path& stagingRoot, const std::filesystem::path& destination) override;

    [[nodiscard]] const std::string& program() const { return program_; }

private:
    std::string program_;
    std::vector<std::string> args_;
};

}
