#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace masf::stage {

struct StagingError {
    std::filesystem::path path;
    std::string cause;
};

// Per-file failures collected during staging. Safe to append from worker threads.
class ErrorLog {
public:
    ErrorLog() = default;
    ErrorLog(const ErrorLog& other);
    ErrorLog& operator=(const ErrorLog& other);

    void add(std::filesystem::path path, std::string cause);

    [[nodiscard]] std::vector<StagingError> entries() const;
    [[nodiscard]] size_t size() const;
    [[nodiscard]] bool empty() const;
    [[nodiscard]] bool contains(const std::filesystem::path& path) const;

private:
    mutable std::mutex mutex_;
    std::vector<StagingError> entries_;
};

}
