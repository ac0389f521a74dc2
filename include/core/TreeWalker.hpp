#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace masf::core {

enum class EntryKind { Directory, Regular, Symlink, Special };

struct TreeEntry {
    fs::path path;          // source path
    fs::path relative;      // path below the source root
    EntryKind kind = EntryKind::Regular;
    uintmax_t size = 0;     // st_size for regular files, 0 otherwise
    struct stat st{};
    fs::path symlinkTarget; // only for EntryKind::Symlink
};

// Fresh lstat of `path`; EntryKind and size are derived from it, symlinks are never followed.
std::optional<TreeEntry> statEntry(const fs::path& path, const fs::path& relative, std::error_code& ec);

class TreeWalker {
public:
    enum class Select { Files, Directories };

    using ErrorSink = std::function<void(const fs::path&, const std::string&)>;

    // Lazy depth-first walk. Directories come before their contents.
    class Cursor {
    public:
        std::optional<TreeEntry> next();

    private:
        friend class TreeWalker;
        Cursor(fs::path root, Select select, ErrorSink onError);

        struct Level {
            fs::directory_iterator it;
        };

        void descend(const fs::path& dir);
        void report(const fs::path& path, const std::string& cause) const;

        fs::path root_;
        Select select_;
        ErrorSink onError_;
        std::vector<Level> stack_;
    };

    explicit TreeWalker(fs::path root, ErrorSink onError = nullptr);

    // Regular files, symlinks and special files.
    [[nodiscard]] Cursor files() const;
    [[nodiscard]] Cursor directories() const;

    [[nodiscard]] std::vector<TreeEntry> collect(Select select) const;

private:
    fs::path root_;
    ErrorSink onError_;
};

} // namespace masf::core
