#include <gtest/gtest.h>
#include "backup_store.hpp"
#include "test_helpers.hpp"
#include <algorithm>
#include <regex>

using namespace testing_support;
using namespace std::chrono;

class BackupStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = tmp_.path() / "backups";
    }

    TempDir tmp_;
    std::filesystem::path root_;
};

// Timestamps are UTC, millisecond precision, with ':' and '.' replaced by '-'
TEST_F(BackupStoreTest, TimestampFormat) {
    sys_days date = year(2026) / October / 19;
    auto when = date + hours(8) + minutes(30) + seconds(5) + milliseconds(123);
    EXPECT_EQ(BackupStore::timestamp(when), "2026-10-19T08-30-05-123Z");

    auto midnight = date + milliseconds(7);
    EXPECT_EQ(BackupStore::timestamp(midnight), "2026-10-19T00-00-00-007Z");
}

TEST_F(BackupStoreTest, TimestampIsFilesystemSafe) {
    std::string stamp = BackupStore::timestamp(system_clock::now());
    EXPECT_TRUE(std::regex_match(stamp, std::regex(R"(\d{4}-\d{2}-\d{2}T\d{2}-\d{2}-\d{2}-\d{3}Z)"))) << stamp;
    EXPECT_EQ(stamp.find(':'), std::string::npos);
    EXPECT_EQ(stamp.find('.'), std::string::npos);
}

TEST_F(BackupStoreTest, ArtifactPaths) {
    BackupStore store(root_);
    EXPECT_EQ(store.artifactPath(ArtifactKind::DatabaseSnapshot, "T1").string(), (root_ / "database-T1.sql").string());
    EXPECT_EQ(store.artifactPath(ArtifactKind::FileArchive, "T1").string(), (root_ / "files-T1.tar.gz").string());
}

TEST_F(BackupStoreTest, Classify) {
    EXPECT_EQ(BackupStore::classify("database-2026-10-19T08-30-05-123Z.sql"), ArtifactKind::DatabaseSnapshot);
    EXPECT_EQ(BackupStore::classify("files-2026-10-19T08-30-05-123Z.tar.gz"), ArtifactKind::FileArchive);
    EXPECT_FALSE(BackupStore::classify("notes.txt"));
    EXPECT_FALSE(BackupStore::classify("files.tar"));
    EXPECT_FALSE(BackupStore::classify("dump.sql.bak"));
}

// Ensure creates missing parents and is idempotent
TEST_F(BackupStoreTest, EnsureCreatesNestedDirectories) {
    BackupStore store(tmp_.path() / "a" / "b" / "backups");
    store.ensure();
    EXPECT_TRUE(std::filesystem::is_directory(store.root()));
    EXPECT_NO_THROW(store.ensure());
}

TEST_F(BackupStoreTest, EnumerateFiltersForeignFiles) {
    BackupStore store(root_);
    store.ensure();
    writeFile(root_ / "database-A.sql", "x");
    writeFile(root_ / "files-A.tar.gz", "x");
    writeFile(root_ / "README.md", "x");

    auto names = store.enumerate();
    ASSERT_TRUE(names.has_value());
    std::sort(names->begin(), names->end());
    EXPECT_EQ(*names, (std::vector<std::string>{"database-A.sql", "files-A.tar.gz"}));
}

TEST_F(BackupStoreTest, EnumerateMissingDirectoryFails) {
    BackupStore store(root_);
    auto names = store.enumerate();
    ASSERT_FALSE(names.has_value());
    EXPECT_EQ(names.error().code, BackupErrc::StorageEnumeration);
}

TEST_F(BackupStoreTest, DescribeReportsVanishedArtifact) {
    BackupStore store(root_);
    store.ensure();
    writeFile(root_ / "database-A.sql", "x");

    auto artifacts = store.describe({"database-A.sql"});
    ASSERT_TRUE(artifacts.has_value());
    ASSERT_EQ(artifacts->size(), 1u);
    EXPECT_EQ((*artifacts)[0].kind, ArtifactKind::DatabaseSnapshot);
    EXPECT_EQ((*artifacts)[0].path.string(), (root_ / "database-A.sql").string());

    auto missing = store.describe({"database-B.sql"});
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, BackupErrc::StorageDeletion);
}
