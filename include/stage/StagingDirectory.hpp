#pragma once

#include <filesystem>

namespace masf::stage {

/**
 * Owns a freshly created temporary directory for the lifetime of one run.
 *
 * The staged tree lives at root(), one level below the mkdtemp directory, so that the
 * source root's own permissions can be applied to it without locking us out of the parent.
 * The destructor removes everything; failures are logged, never thrown.
 */
class StagingDirectory {
public:
    explicit StagingDirectory(const std::filesystem::path& parent = {});
    ~StagingDirectory();

    StagingDirectory(const StagingDirectory&) = delete;
    StagingDirectory& operator=(const StagingDirectory&) = delete;

    [[nodiscard]] const std::filesystem::path& root() const { return root_; }

    // Removes the directory now. Returns false (and logs) on failure.
    bool remove() noexcept;

private:
    std::filesystem::path base_;
    std::filesystem::path root_;
    bool removed_ = false;
};

}
