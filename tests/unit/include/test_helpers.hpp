#pragma once

#include "image/ImageBuilder.hpp"

#include <filesystem>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include <fcntl.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace masf::test {

// Unique scratch directory below the system temp dir, removed (even if read-only) on destruction.
class TempDir {
public:
    explicit TempDir(const std::string& prefix = "masf_test") {
        std::string tmpl = (fs::temp_directory_path() / (prefix + "_XXXXXX")).string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        if (!::mkdtemp(buf.data())) throw std::runtime_error("mkdtemp failed for " + tmpl);
        path_ = buf.data();
    }

    ~TempDir() {
        std::error_code ec;
        for (fs::recursive_directory_iterator it(path_, ec), end; !ec && it != end; it.increment(ec))
            if (it->is_directory(ec) && !it->is_symlink(ec)) fs::permissions(it->path(), fs::perms::owner_all,
                                                                              fs::perm_options::add, ec);
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const fs::path& path() const { return path_; }
    fs::path operator/(const fs::path& rel) const { return path_ / rel; }

private:
    fs::path path_;
};

inline void writeFile(const fs::path& path, const size_t size, const char fill = 'x') {
    if (path.has_parent_path()) fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << std::string(size, fill);
}

inline std::string readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

// Every entry below `root` (directories, files, symlinks), relative, without following symlinks.
inline std::set<std::string> relativePaths(const fs::path& root) {
    std::set<std::string> out;
    for (const auto& e : fs::recursive_directory_iterator(root))
        out.insert(e.path().lexically_relative(root).string());
    return out;
}

inline struct stat lstatOf(const fs::path& path) {
    struct stat st{};
    if (::lstat(path.c_str(), &st) != 0) throw std::runtime_error("lstat failed for " + path.string());
    return st;
}

inline void setTimes(const fs::path& path, const time_t sec, const long nsec) {
    const timespec times[2] = {{sec, nsec}, {sec, nsec}};
    if (::utimensat(AT_FDCWD, path.c_str(), times, AT_SYMLINK_NOFOLLOW) != 0)
        throw std::runtime_error("utimensat failed for " + path.string());
}

// A bound unix socket at `path`, closed on destruction. The socket file itself stays.
class UnixSocket {
public:
    explicit UnixSocket(const fs::path& path) : fd_(::socket(AF_UNIX, SOCK_STREAM, 0)) {
        if (fd_ < 0) throw std::runtime_error("socket() failed");

        sockaddr_un addr{};
        addr.sun_family = AF_UNIX;
        if (path.string().size() >= sizeof(addr.sun_path)) throw std::runtime_error("socket path too long: " + path.string());
        std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

        if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
            ::close(fd_);
            throw std::runtime_error("bind() failed for " + path.string());
        }
    }

    ~UnixSocket() { ::close(fd_); }

    UnixSocket(const UnixSocket&) = delete;
    UnixSocket& operator=(const UnixSocket&) = delete;

private:
    int fd_;
};

// Stands in for the external archiver; records what it was handed.
struct FakeBuilder final : image::ImageBuilder {
    int status = 0;
    int calls = 0;
    fs::path stagingRoot;
    fs::path destination;
    std::set<std::string> staged;

    explicit FakeBuilder(const int s = 0) : status(s) {}

    int build(const fs::path& root, const fs::path& dest) override {
        ++calls;
        stagingRoot = root;
        destination = dest;
        staged = relativePaths(root);
        return status;
    }
};

}
