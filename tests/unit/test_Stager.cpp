#include <gtest/gtest.h>
#include "stage/Stager.hpp"
#include "test_helpers.hpp"

#include <fmt/core.h>

#include <csignal>
#include <sys/resource.h>
#include <sys/stat.h>
#include <unistd.h>

using namespace masf::stage;
using masf::rules::RuleSet;
using masf::test::TempDir;
using masf::test::writeFile;
using masf::test::readFile;
using masf::test::relativePaths;
using masf::test::lstatOf;
using masf::test::setTimes;

class StagerTest : public ::testing::Test {
protected:
    TempDir src{"masf_src"};
    TempDir out{"masf_stage"};

    RuleSet rules = RuleSet::fromArgs({".txt=1000"}, "100");

    void SetUp() override {
        writeFile(src / "a.txt", 500, 'a');
        writeFile(src / "b.txt", 2000, 'b');
        writeFile(src / "c.bin", 50, 'c');
        writeFile(src / "nested/big.bin", 5000, 'n');
        fs::create_directories(src / "nested/empty");
        fs::create_symlink("a.txt", src / "to_a");
        fs::create_symlink("does/not/exist", src / "dangling");
    }

    ErrorLog stage(Stager& stager) const { return stager.stage(src.path(), out.path()); }
};

TEST_F(StagerTest, KeepsSmallFilesAndStubsTheRest) {
    Stager stager(rules);
    const auto errors = stage(stager);
    EXPECT_TRUE(errors.empty());

    EXPECT_EQ(readFile(out / "a.txt"), std::string(500, 'a'));
    EXPECT_EQ(readFile(out / "c.bin"), std::string(50, 'c'));

    EXPECT_EQ(fs::file_size(out / "b.txt"), 0u);
    EXPECT_EQ(fs::file_size(out / "nested/big.bin"), 0u);

    const auto s = stager.stats();
    EXPECT_EQ(s.kept, 2u);
    EXPECT_EQ(s.placeholders, 2u);
    EXPECT_EQ(s.symlinks, 2u);
    EXPECT_EQ(s.bytesKept, 550u);
    EXPECT_EQ(s.bytesOmitted, 7000u);
}

TEST_F(StagerTest, MirrorsTheWholeStructure) {
    Stager stager(rules);
    EXPECT_TRUE(stage(stager).empty());
    EXPECT_EQ(relativePaths(out.path()), relativePaths(src.path()));
    EXPECT_TRUE(fs::is_directory(out / "nested/empty"));
    EXPECT_EQ(stager.stats().directories, 2u);
}

TEST_F(StagerTest, ReplicatesSymlinksVerbatim) {
    Stager stager(rules);
    EXPECT_TRUE(stage(stager).empty());

    ASSERT_TRUE(fs::is_symlink(out / "to_a"));
    EXPECT_EQ(fs::read_symlink(out / "to_a"), fs::path("a.txt"));
    ASSERT_TRUE(fs::is_symlink(out / "dangling"));
    EXPECT_EQ(fs::read_symlink(out / "dangling"), fs::path("does/not/exist"));
}

TEST_F(StagerTest, StoreFileSizesProducesSparseZeroFilledPlaceholders) {
    Stager stager(rules, {.storeFileSizes = true});
    EXPECT_TRUE(stage(stager).empty());

    EXPECT_EQ(fs::file_size(out / "nested/big.bin"), 5000u);
    EXPECT_EQ(readFile(out / "nested/big.bin"), std::string(5000, '\0'));
    EXPECT_EQ(fs::file_size(out / "b.txt"), 2000u);

    const auto st = lstatOf(out / "nested/big.bin");
    EXPECT_LT(static_cast<uintmax_t>(st.st_blocks) * 512u, 5000u);

    // kept files are untouched by the flag
    EXPECT_EQ(readFile(out / "a.txt"), std::string(500, 'a'));
}

TEST_F(StagerTest, PreservesModeAndTimestamps) {
    fs::permissions(src / "b.txt", fs::perms::owner_read | fs::perms::group_read);
    fs::permissions(src / "a.txt", fs::perms::owner_read | fs::perms::owner_exec);
    setTimes(src / "a.txt", 1000000000, 123456789);
    setTimes(src / "b.txt", 1100000000, 5);
    setTimes(src / "nested/empty", 1200000000, 0);
    setTimes(src / "nested", 1300000000, 0);
    setTimes(src / "to_a", 1400000000, 0);

    Stager stager(rules);
    EXPECT_TRUE(stage(stager).empty());

    for (const auto* rel : {"a.txt", "b.txt", "nested", "nested/empty", "to_a"}) {
        SCOPED_TRACE(rel);
        const auto want = lstatOf(src / rel);
        const auto got = lstatOf(out / rel);
        EXPECT_EQ(got.st_mode, want.st_mode);
        EXPECT_EQ(got.st_mtim.tv_sec, want.st_mtim.tv_sec);
        EXPECT_EQ(got.st_mtim.tv_nsec, want.st_mtim.tv_nsec);
    }
}

TEST_F(StagerTest, StoreFileSizesLeavesOtherMetadataAlone) {
    fs::permissions(src / "b.txt", fs::perms::owner_read | fs::perms::owner_write);
    setTimes(src / "b.txt", 1234567890, 42);

    Stager stager(rules, {.storeFileSizes = true});
    EXPECT_TRUE(stage(stager).empty());

    const auto want = lstatOf(src / "b.txt");
    const auto got = lstatOf(out / "b.txt");
    EXPECT_EQ(got.st_size, want.st_size);
    EXPECT_EQ(got.st_mode, want.st_mode);
    EXPECT_EQ(got.st_mtim.tv_sec, want.st_mtim.tv_sec);
    EXPECT_EQ(got.st_mtim.tv_nsec, want.st_mtim.tv_nsec);
}

TEST_F(StagerTest, VanishedFileIsRecordedAndSkipped) {
    using masf::core::TreeWalker;

    const auto entries = TreeWalker(src.path()).collect(TreeWalker::Select::Files);
    fs::remove(src / "c.bin");

    Stager stager(rules);
    ErrorLog errors;
    for (const auto& e : entries) stager.stageEntry(e, out.path(), errors);

    ASSERT_EQ(errors.size(), 1u);
    EXPECT_TRUE(errors.contains(src / "c.bin"));
    EXPECT_FALSE(fs::exists(out / "c.bin"));
    EXPECT_EQ(readFile(out / "a.txt"), std::string(500, 'a'));
}

TEST_F(StagerTest, UnreadableDirectoryIsRecordedOnce) {
    if (::geteuid() == 0) GTEST_SKIP() << "root can read any directory";

    writeFile(src / "locked/inside.txt", 10);
    fs::permissions(src / "locked", fs::perms::owner_write | fs::perms::owner_exec);

    Stager stager(rules);
    const auto errors = stage(stager);

    ASSERT_EQ(errors.size(), 1u);
    EXPECT_TRUE(errors.contains(src / "locked"));
    EXPECT_TRUE(fs::is_directory(out / "locked"));
    EXPECT_EQ(readFile(out / "a.txt"), std::string(500, 'a'));
}

TEST_F(StagerTest, PlaceholderThatCannotBeSizedIsNotLeftBehind) {
    // Growing a file past RLIMIT_FSIZE fails with EFBIG (and SIGXFSZ, ignored here).
    struct FileSizeLimit {
        rlimit saved{};
        sighandler_t handler;

        explicit FileSizeLimit(const rlim_t bytes) : handler(std::signal(SIGXFSZ, SIG_IGN)) {
            ::getrlimit(RLIMIT_FSIZE, &saved);
            rlimit lowered = saved;
            lowered.rlim_cur = bytes;
            ::setrlimit(RLIMIT_FSIZE, &lowered);
        }

        ~FileSizeLimit() {
            ::setrlimit(RLIMIT_FSIZE, &saved);
            std::signal(SIGXFSZ, handler);
        }
    };

    Stager stager(rules, {.storeFileSizes = true});
    ErrorLog errors;
    {
        const FileSizeLimit limit(1000);
        errors = stage(stager);
    }

    EXPECT_TRUE(errors.contains(src / "b.txt"));
    EXPECT_TRUE(errors.contains(src / "nested/big.bin"));
    EXPECT_FALSE(fs::exists(fs::symlink_status(out / "b.txt")));
    EXPECT_FALSE(fs::exists(fs::symlink_status(out / "nested/big.bin")));

    // everything below the limit is staged as usual
    EXPECT_EQ(readFile(out / "a.txt"), std::string(500, 'a'));
    EXPECT_EQ(readFile(out / "c.bin"), std::string(50, 'c'));
    EXPECT_EQ(stager.stats().placeholders, 0u);
}

TEST_F(StagerTest, FileReplacedByDirectoryIsRecorded) {
    using masf::core::TreeWalker;

    const auto entries = TreeWalker(src.path()).collect(TreeWalker::Select::Files);
    fs::remove(src / "c.bin");
    fs::create_directory(src / "c.bin");

    Stager stager(rules);
    ErrorLog errors;
    for (const auto& e : entries) stager.stageEntry(e, out.path(), errors);

    EXPECT_TRUE(errors.contains(src / "c.bin"));
}

TEST_F(StagerTest, ClassifiesOnSizeAtStagingTime) {
    using masf::core::TreeWalker;

    const auto entries = TreeWalker(src.path()).collect(TreeWalker::Select::Files);
    writeFile(src / "a.txt", 1500, 'A');

    Stager stager(rules);
    ErrorLog errors;
    for (const auto& e : entries) stager.stageEntry(e, out.path(), errors);

    EXPECT_TRUE(errors.empty());
    EXPECT_EQ(fs::file_size(out / "a.txt"), 0u);
}

TEST_F(StagerTest, StagingTwiceGivesTheSameTree) {
    TempDir second{"masf_stage2"};

    Stager stager(rules);
    EXPECT_TRUE(stager.stage(src.path(), out.path()).empty());
    EXPECT_TRUE(stager.stage(src.path(), second.path()).empty());

    EXPECT_EQ(relativePaths(out.path()), relativePaths(second.path()));
    for (const auto& rel : relativePaths(out.path())) {
        if (fs::is_regular_file(fs::symlink_status(out / rel)))
            EXPECT_EQ(readFile(out / rel), readFile(second / rel)) << rel;
    }
}

TEST_F(StagerTest, ParallelStagingMatchesSequential) {
    for (int i = 0; i < 40; ++i) writeFile(src / fmt::format("many/f{:02}.txt", i), i * 50, 'm');

    TempDir parallel{"masf_stage_par"};

    Stager sequential(rules);
    Stager concurrent(rules, {.jobs = 4});
    EXPECT_TRUE(sequential.stage(src.path(), out.path()).empty());
    EXPECT_TRUE(concurrent.stage(src.path(), parallel.path()).empty());

    EXPECT_EQ(relativePaths(out.path()), relativePaths(parallel.path()));
    for (const auto& rel : relativePaths(out.path())) {
        if (fs::is_regular_file(fs::symlink_status(out / rel)))
            EXPECT_EQ(readFile(out / rel), readFile(parallel / rel)) << rel;
    }

    EXPECT_EQ(sequential.stats().kept, concurrent.stats().kept);
    EXPECT_EQ(sequential.stats().placeholders, concurrent.stats().placeholders);
    EXPECT_EQ(sequential.stats().bytesOmitted, concurrent.stats().bytesOmitted);
}

TEST_F(StagerTest, RecreatesFifos) {
    ASSERT_EQ(::mkfifo((src / "pipe").c_str(), 0640), 0);

    Stager stager(rules);
    EXPECT_TRUE(stage(stager).empty());

    const auto st = lstatOf(out / "pipe");
    EXPECT_TRUE(S_ISFIFO(st.st_mode));
    EXPECT_EQ(st.st_mode & 07777, 0640u);
    EXPECT_EQ(stager.stats().special, 1u);
}

TEST_F(StagerTest, ReadOnlySourceDirectoryIsMirrored) {
    writeFile(src / "ro/inside.txt", 10);
    fs::permissions(src / "ro", fs::perms::owner_read | fs::perms::owner_exec);

    Stager stager(rules);
    EXPECT_TRUE(stage(stager).empty());

    EXPECT_EQ(readFile(out / "ro/inside.txt"), std::string(10, 'x'));
    EXPECT_EQ(lstatOf(out / "ro").st_mode & 07777, 0500u);
}
