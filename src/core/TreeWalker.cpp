#include "core/TreeWalker.hpp"
#include "log/Registry.hpp"

#include <cerrno>
#include <system_error>

namespace masf::core {

static EntryKind kindOf(const mode_t mode) {
    if (S_ISDIR(mode)) return EntryKind::Directory;
    if (S_ISREG(mode)) return EntryKind::Regular;
    if (S_ISLNK(mode)) return EntryKind::Symlink;
    return EntryKind::Special;
}

std::optional<TreeEntry> statEntry(const fs::path& path, const fs::path& relative, std::error_code& ec) {
    ec.clear();

    TreeEntry entry;
    if (::lstat(path.c_str(), &entry.st) != 0) {
        ec.assign(errno, std::generic_category());
        return std::nullopt;
    }

    entry.path = path;
    entry.relative = relative;
    entry.kind = kindOf(entry.st.st_mode);
    if (entry.kind == EntryKind::Regular) entry.size = static_cast<uintmax_t>(entry.st.st_size);

    if (entry.kind == EntryKind::Symlink) {
        entry.symlinkTarget = fs::read_symlink(path, ec);
        if (ec) return std::nullopt;
    }

    return entry;
}

TreeWalker::TreeWalker(fs::path root, ErrorSink onError)
    : root_(std::move(root)), onError_(std::move(onError)) {}

TreeWalker::Cursor TreeWalker::files() const { return {root_, Select::Files, onError_}; }

TreeWalker::Cursor TreeWalker::directories() const { return {root_, Select::Directories, onError_}; }

std::vector<TreeEntry> TreeWalker::collect(const Select select) const {
    std::vector<TreeEntry> entries;
    auto cursor = select == Select::Files ? files() : directories();
    while (auto e = cursor.next()) entries.push_back(std::move(*e));
    return entries;
}

TreeWalker::Cursor::Cursor(fs::path root, const Select select, ErrorSink onError)
    : root_(std::move(root)), select_(select), onError_(std::move(onError)) {
    descend(root_);
}

void TreeWalker::Cursor::report(const fs::path& path, const std::string& cause) const {
    log::Registry::walker()->info("[TreeWalker] {}: {}", path.string(), cause);
    if (onError_) onError_(path, cause);
}

void TreeWalker::Cursor::descend(const fs::path& dir) {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        report(dir, ec.message());
        return;
    }
    stack_.push_back(Level{std::move(it)});
}

std::optional<TreeEntry> TreeWalker::Cursor::next() {
    while (!stack_.empty()) {
        auto& top = stack_.back();
        if (top.it == fs::directory_iterator{}) {
            stack_.pop_back();
            continue;
        }

        const fs::path path = top.it->path();

        std::error_code ec;
        top.it.increment(ec);
        if (ec) {
            report(path.parent_path(), ec.message());
            stack_.pop_back();
        }

        auto entry = statEntry(path, path.lexically_relative(root_), ec);
        if (!entry) {
            report(path, ec.message());
            continue;
        }

        if (entry->kind == EntryKind::Directory) {
            descend(path);
            if (select_ == Select::Directories) return entry;
            continue;
        }

        if (select_ == Select::Files) return entry;
    }
    return std::nullopt;
}

} // namespace masf::core
