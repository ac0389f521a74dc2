#pragma once

#include "core/TreeWalker.hpp"
#include "rules/RuleSet.hpp"
#include "stage/ErrorLog.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>

namespace masf::stage {

struct StageOptions {
    bool storeFileSizes = false;  // stamp placeholders with the original size (sparse)
    unsigned int jobs = 1;        // >1 stages files on a worker pool
};

struct StageStats {
    uintmax_t directories = 0;
    uintmax_t kept = 0;
    uintmax_t placeholders = 0;
    uintmax_t symlinks = 0;
    uintmax_t special = 0;
    uintmax_t bytesKept = 0;
    uintmax_t bytesOmitted = 0;
};

/**
 * Materializes the keep/placeholder decision for a whole source tree into a staging root.
 *
 * Directories are created first (so empty ones survive), then every non-directory entry is
 * staged, then directory metadata is applied deepest-first so that timestamps are not
 * disturbed by the writes below them. A failure on one entry is recorded in the returned
 * ErrorLog and never stops the run.
 */
class Stager {
public:
    explicit Stager(rules::RuleSet rules, StageOptions options = {});

    ErrorLog stage(const std::filesystem::path& sourceRoot, const std::filesystem::path& stagingRoot);

    // Stages one non-directory entry below `stagingRoot`. Failures land in `errors`.
    void stageEntry(const core::TreeEntry& entry, const std::filesystem::path& stagingRoot, ErrorLog& errors);

    [[nodiscard]] StageStats stats() const;

private:
    struct Counters {
        std::atomic<uintmax_t> directories{0};
        std::atomic<uintmax_t> kept{0};
        std::atomic<uintmax_t> placeholders{0};
        std::atomic<uintmax_t> symlinks{0};
        std::atomic<uintmax_t> special{0};
        std::atomic<uintmax_t> bytesKept{0};
        std::atomic<uintmax_t> bytesOmitted{0};

        void reset();
    };

    void stageFilesSequential(const core::TreeWalker& walker, const std::filesystem::path& stagingRoot, ErrorLog& errors);
    void stageFilesParallel(const core::TreeWalker& walker, const std::filesystem::path& stagingRoot, ErrorLog& errors);

    void stageRegular(const core::TreeEntry& entry, const std::filesystem::path& dst, ErrorLog& errors);
    void stageSymlink(const core::TreeEntry& entry, const std::filesystem::path& dst, ErrorLog& errors);
    void stageSpecial(const core::TreeEntry& entry, const std::filesystem::path& dst, ErrorLog& errors);

    static void fail(ErrorLog& errors, const std::filesystem::path& path, const std::string& cause);
    static void discard(const std::filesystem::path& dst);

    rules::RuleSet rules_;
    StageOptions options_;
    Counters counters_;
};

}
