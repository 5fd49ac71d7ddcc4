/**
 * @file test_persist.cpp
 * @brief Persister writes into a scratch directory under the system temp dir.
 */

#include <gtest/gtest.h>

#include "pagezip/errors.hpp"
#include "pagezip/persist.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <string>

namespace fs = std::filesystem;
using namespace pagezip;

class PersisterTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() / ("pagezip_persist_" + std::to_string(std::random_device{}()));
        fs::create_directories(root_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    static Bytes slurp(const fs::path& p) {
        std::ifstream f(p, std::ios::binary);
        return Bytes(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
    }

    fs::path root_;
};

TEST_F(PersisterTest, CreatesDirectoryAndWritesArchive) {
    const fs::path outdir = root_ / "downloads";
    ASSERT_FALSE(fs::exists(outdir));
    const Bytes blob = {'P', 'K', 5, 6, 0, 0, 1, 2, 3};

    const size_t n = Persister(outdir.string(), false).persist("My_Title", blob);

    const fs::path file = outdir / "My_Title.zip";
    ASSERT_TRUE(fs::is_regular_file(file));
    EXPECT_EQ(n, blob.size());
    EXPECT_EQ(fs::file_size(file), n);
    EXPECT_EQ(slurp(file), blob);
}

TEST_F(PersisterTest, CreatesNestedDirectories) {
    const fs::path outdir = root_ / "a" / "b" / "c";
    Persister(outdir.string(), false).persist("T", {1, 2});
    EXPECT_TRUE(fs::is_regular_file(outdir / "T.zip"));
}

TEST_F(PersisterTest, SecondPersistOverwritesWithIdenticalBytes) {
    const fs::path outdir = root_ / "downloads";
    const Persister persister(outdir.string(), false);
    const Bytes blob(1000, 0x5a);

    EXPECT_EQ(persister.persist("Same", blob), blob.size());
    EXPECT_EQ(persister.persist("Same", blob), blob.size());

    EXPECT_EQ(slurp(outdir / "Same.zip"), blob);
    EXPECT_EQ(std::distance(fs::directory_iterator(outdir), fs::directory_iterator()), 1);
}

TEST_F(PersisterTest, ShorterArchiveTruncatesOldFile) {
    const Persister persister((root_ / "d").string(), false);
    persister.persist("P", Bytes(500, 1));
    persister.persist("P", Bytes(3, 2));
    EXPECT_EQ(fs::file_size(root_ / "d" / "P.zip"), 3u);
}

TEST_F(PersisterTest, EmptyArchiveWritesEmptyFile) {
    EXPECT_EQ(Persister((root_ / "d").string(), false).persist("Empty", {}), 0u);
    EXPECT_EQ(fs::file_size(root_ / "d" / "Empty.zip"), 0u);
}

TEST_F(PersisterTest, OutdirThatIsAFileFails) {
    const fs::path blocker = root_ / "downloads";
    std::ofstream(blocker) << "not a directory";

    EXPECT_THROW(Persister(blocker.string(), false).persist("T", {1}), PersistFailure);
}

TEST_F(PersisterTest, EmptyTitleFails) {
    EXPECT_THROW(Persister((root_ / "d").string(), false).persist("", {1}), PersistFailure);
}

TEST(PersisterPathTest, DefaultsToDownloadsDirectory) {
    EXPECT_EQ(Persister().path_for("My_Title"), "downloads/My_Title.zip");
    EXPECT_EQ(Persister("").path_for("x"), "x.zip");
}
