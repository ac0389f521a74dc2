#include "stage/ErrorLog.hpp"

#include <algorithm>

namespace masf::stage {

ErrorLog::ErrorLog(const ErrorLog& other) : entries_(other.entries()) {}

ErrorLog& ErrorLog::operator=(const ErrorLog& other) {
    if (this == &other) return *this;
    auto copy = other.entries();
    std::scoped_lock lock(mutex_);
    entries_ = std::move(copy);
    return *this;
}

void ErrorLog::add(std::filesystem::path path, std::string cause) {
    std::scoped_lock lock(mutex_);
    entries_.push_back({std::move(path), std::move(cause)});
}

std::vector<StagingError> ErrorLog::entries() const {
    std::scoped_lock lock(mutex_);
    return entries_;
}

size_t ErrorLog::size() const {
    std::scoped_lock lock(mutex_);
    return entries_.size();
}

bool ErrorLog::empty() const { return size() == 0; }

bool ErrorLog::contains(const std::filesystem::path& path) const {
    std::scoped_lock lock(mutex_);
    return std::ranges::any_of(entries_, [&path](const auto& e) { return e.path == path; });
}

}
