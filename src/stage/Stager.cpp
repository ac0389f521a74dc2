#include "stage/Stager.hpp"
#include "stage/metadata.hpp"
#include "rules/Classifier.hpp"
#include "concurrency/ThreadPool.hpp"
#include "concurrency/stage/StageEntryTask.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <cerrno>
#include <future>
#include <ranges>
#include <system_error>
#include <vector>
#include <fcntl.h>
#include <unistd.h>

namespace masf::stage {

using core::EntryKind;
using core::TreeEntry;
using core::TreeWalker;

void Stager::Counters::reset() {
    directories = 0;
    kept = 0;
    placeholders = 0;
    symlinks = 0;
    special = 0;
    bytesKept = 0;
    bytesOmitted = 0;
}

Stager::Stager(rules::RuleSet rules, const StageOptions options)
    : rules_(std::move(rules)), options_(options) {
    if (options_.jobs == 0) options_.jobs = 1;
}

StageStats Stager::stats() const {
    return {
        .directories = counters_.directories.load(),
        .kept = counters_.kept.load(),
        .placeholders = counters_.placeholders.load(),
        .symlinks = counters_.symlinks.load(),
        .special = counters_.special.load(),
        .bytesKept = counters_.bytesKept.load(),
        .bytesOmitted = counters_.bytesOmitted.load(),
    };
}

void Stager::fail(ErrorLog& errors, const fs::path& path, const std::string& cause) {
    log::Registry::stager()->info("[Stager] {}: {}", path.string(), cause);
    errors.add(path, cause);
}

// A half-staged file must not reach the image looking like a good copy or placeholder.
void Stager::discard(const fs::path& dst) {
    std::error_code ec;
    fs::remove(dst, ec);
    if (ec) log::Registry::stager()->warn("[Stager] Failed to discard {}: {}", dst.string(), ec.message());
}

ErrorLog Stager::stage(const fs::path& sourceRoot, const fs::path& stagingRoot) {
    counters_.reset();
    ErrorLog errors;

    // Both passes hit the same unreadable directories; only the contents walk records them.
    const TreeWalker dirWalker(sourceRoot);
    const TreeWalker walker(sourceRoot, [&errors](const fs::path& p, const std::string& cause) {
        errors.add(p, cause);
    });

    log::Registry::stager()->info("[Stager] Staging {} into {} ({} job(s), store file sizes: {})",
                                  sourceRoot.string(), stagingRoot.string(), options_.jobs, options_.storeFileSizes);

    // 1) structure
    const auto dirs = dirWalker.collect(TreeWalker::Select::Directories);
    for (const auto& d : dirs) {
        std::error_code ec;
        fs::create_directory(stagingRoot / d.relative, ec);
        if (ec) fail(errors, d.path, ec.message());
        else ++counters_.directories;
    }

    // 2) contents
    if (options_.jobs > 1) stageFilesParallel(walker, stagingRoot, errors);
    else stageFilesSequential(walker, stagingRoot, errors);

    // 3) directory metadata, children before parents, the root last
    for (const auto& d : dirs | std::views::reverse) {
        const auto dst = stagingRoot / d.relative;
        std::error_code ec;
        if (!fs::exists(dst, ec)) continue;
        copyMetadata(d.path, d.st, dst, ec);
        if (ec) fail(errors, d.path, ec.message());
    }

    std::error_code ec;
    if (const auto root = core::statEntry(sourceRoot, {}, ec)) {
        copyMetadata(sourceRoot, root->st, stagingRoot, ec);
        if (ec) fail(errors, sourceRoot, ec.message());
    } else fail(errors, sourceRoot, ec.message());

    const auto s = stats();
    log::Registry::stager()->info("[Stager] Done: {} kept, {} placeholders, {} symlinks, {} special, {} directories, {} error(s)",
                                  s.kept, s.placeholders, s.symlinks, s.special, s.directories, errors.size());
    return errors;
}

void Stager::stageFilesSequential(const TreeWalker& walker, const fs::path& stagingRoot, ErrorLog& errors) {
    auto cursor = walker.files();
    while (const auto entry = cursor.next()) stageEntry(*entry, stagingRoot, errors);
}

void Stager::stageFilesParallel(const TreeWalker& walker, const fs::path& stagingRoot, ErrorLog& errors) {
    concurrency::ThreadPool pool(options_.jobs);
    std::vector<std::future<ExpectedFuture>> futures;

    auto cursor = walker.files();
    while (auto entry = cursor.next()) {
        auto task = std::make_shared<concurrency::StageEntryTask>(*this, std::move(*entry), stagingRoot, errors);
        futures.push_back(task->getFuture().value());
        pool.submit(task);
    }

    // The archiver must only ever see a quiescent tree.
    unsigned int crashed = 0;
    for (auto& f : futures)
        if (std::holds_alternative<std::string>(f.get())) ++crashed;

    pool.stop();

    if (crashed) log::Registry::stager()->error("[Stager] {} staging task(s) aborted unexpectedly", crashed);
}

void Stager::stageEntry(const TreeEntry& entry, const fs::path& stagingRoot, ErrorLog& errors) {
    const auto dst = stagingRoot / entry.relative;

    std::error_code ec;
    fs::create_directories(dst.parent_path(), ec);
    if (ec) {
        fail(errors, entry.path, ec.message());
        return;
    }

    switch (entry.kind) {
    case EntryKind::Regular: stageRegular(entry, dst, errors); break;
    case EntryKind::Symlink: stageSymlink(entry, dst, errors); break;
    case EntryKind::Special: stageSpecial(entry, dst, errors); break;
    case EntryKind::Directory:
        fs::create_directory(dst, ec);
        if (!ec) copyMetadata(entry.path, entry.st, dst, ec);
        if (ec) fail(errors, entry.path, ec.message());
        break;
    }
}

void Stager::stageRegular(const TreeEntry& entry, const fs::path& dst, ErrorLog& errors) {
    // The walk may be stale by now, classify on what is there at copy time.
    std::error_code ec;
    const auto fresh = core::statEntry(entry.path, entry.relative, ec);
    if (!fresh) {
        fail(errors, entry.path, ec.message());
        return;
    }
    if (fresh->kind != EntryKind::Regular) {
        fail(errors, entry.path, "no longer a regular file");
        return;
    }

    const auto verdict = rules::classify(fresh->relative.string(), fresh->size, rules_);
    log::Registry::stager()->debug("[Stager] {} ({} bytes) -> {}", fresh->relative.string(), fresh->size,
                                   rules::to_string(verdict));

    if (verdict == rules::Verdict::Keep) {
        fs::copy_file(fresh->path, dst, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            fail(errors, entry.path, ec.message());
            discard(dst);
            return;
        }
    } else {
        const int fd = ::open(dst.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
        if (fd < 0) {
            fail(errors, entry.path, std::error_code(errno, std::generic_category()).message());
            return;
        }
        ::close(fd);

        if (options_.storeFileSizes) {
            fs::resize_file(dst, fresh->size, ec);
            if (ec) {
                fail(errors, entry.path, ec.message());
                discard(dst);
                return;
            }
        }
    }

    copyMetadata(fresh->path, fresh->st, dst, ec);
    if (ec) {
        fail(errors, entry.path, ec.message());
        discard(dst);
        return;
    }

    if (verdict == rules::Verdict::Keep) {
        ++counters_.kept;
        counters_.bytesKept += fresh->size;
    } else {
        ++counters_.placeholders;
        counters_.bytesOmitted += fresh->size;
    }
}

void Stager::stageSymlink(const TreeEntry& entry, const fs::path& dst, ErrorLog& errors) {
    std::error_code ec;
    fs::create_symlink(entry.symlinkTarget, dst, ec);
    if (ec) {
        fail(errors, entry.path, ec.message());
        return;
    }

    copyMetadata(entry.path, entry.st, dst, ec);
    if (ec) {
        fail(errors, entry.path, ec.message());
        discard(dst);
        return;
    }
    ++counters_.symlinks;
}

void Stager::stageSpecial(const TreeEntry& entry, const fs::path& dst, ErrorLog& errors) {
    if (S_ISSOCK(entry.st.st_mode)) {
        fail(errors, entry.path, "sockets cannot be staged");
        return;
    }

    if (::mknod(dst.c_str(), entry.st.st_mode, entry.st.st_rdev) != 0) {
        fail(errors, entry.path, std::error_code(errno, std::generic_category()).message());
        return;
    }

    std::error_code ec;
    copyMetadata(entry.path, entry.st, dst, ec);
    if (ec) {
        fail(errors, entry.path, ec.message());
        discard(dst);
        return;
    }
    ++counters_.special;
}

}
