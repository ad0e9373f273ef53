// ============================================================================
// BACKUP MANAGER UNIT TESTS
// ============================================================================
// Tests for dated snapshots, retention, listing and restore
// ============================================================================

#include <gtest/gtest.h>
#include <healthstream/core/storage/backup_manager.hpp>
#include <healthstream/core/storage/sqlite_backend.hpp>
#include "support/test_support.hpp"
#include <filesystem>
#include <fstream>

using namespace HealthStream;
using namespace HealthStream::Testing;

namespace fs = std::filesystem;

// ============================================================================
// TEST CLASS
// ============================================================================
class BackupManagerTest : public ::testing::Test {
protected:
    TempDir dir{"backup"};
    ManualClock clock{"20240315102345"};

    BackupConfig backupConfig(bool enabled = true, int retention = 30) {
        BackupConfig c;
        c.enabled = enabled;
        c.backup_dir = dir.file("backups");
        c.retention_days = retention;
        return c;
    }

    SqliteConfig dbConfig() {
        SqliteConfig c;
        c.db_path = dir.file("health.db");
        return c;
    }

    void touch(const std::string& name) {
        fs::create_directories(dir.path() / "backups");
        std::ofstream(dir.path() / "backups" / name) << "x";
    }

    bool exists(const std::string& name) {
        return fs::exists(dir.path() / "backups" / name);
    }
};

// ============================================================================
// NAMING TESTS
// ============================================================================

TEST(BackupNames, FileNameForDate) {
    EXPECT_EQ(BackupManager::fileNameForDate("20240315"), "health_20240315.db");
}

TEST(BackupNames, ParseFileDate) {
    EXPECT_EQ(BackupManager::parseFileDate("health_20240315.db"), std::optional<std::string>("20240315"));
    EXPECT_FALSE(BackupManager::parseFileDate("health_20240315.db.tmp"));
    EXPECT_FALSE(BackupManager::parseFileDate("health_2024031.db"));
    EXPECT_FALSE(BackupManager::parseFileDate("health_2024031x.db"));
    EXPECT_FALSE(BackupManager::parseFileDate("health_20240231.db"));
    EXPECT_FALSE(BackupManager::parseFileDate("other_20240315.db"));
    EXPECT_FALSE(BackupManager::parseFileDate("notes.txt"));
}

// ============================================================================
// CREATE TESTS
// ============================================================================

TEST_F(BackupManagerTest, CreateWritesDatedSnapshot) {
    SqliteBackend backend(dbConfig());
    backend.writeAggregated({AggregatedEntry{"20240315102300", "db", "latency", 1, 2, 1.5, 2}});
    backend.flush();

    BackupManager manager(backupConfig(), clock.source());
    auto path = manager.createBackup(backend);

    EXPECT_EQ(fs::path(path).filename().string(), "health_20240315.db");
    EXPECT_TRUE(fs::exists(path));
    EXPECT_FALSE(exists("health_20240315.db.tmp"));
    EXPECT_EQ(manager.listBackups(), (std::vector<std::string>{"health_20240315.db"}));
}

TEST_F(BackupManagerTest, SameDayBackupReplacesPrevious) {
    SqliteBackend backend(dbConfig());
    BackupManager manager(backupConfig(), clock.source());

    manager.createBackup(backend);
    backend.writeAggregated({AggregatedEntry{"20240315102300", "db", "latency", 1, 1, 1, 1}});
    backend.flush();
    clock.advance(std::chrono::hours(1));
    manager.createBackup(backend);

    EXPECT_EQ(manager.listBackups().size(), 1u);

    SqliteConfig copy;
    copy.db_path = dir.file("backups/health_20240315.db");
    SqliteBackend snapshot(copy);
    EXPECT_EQ(snapshot.readMetrics("", rangeStart(), rangeEnd()).size(), 1u);
}

TEST_F(BackupManagerTest, DisabledCreateIsNoOp) {
    SqliteBackend backend(dbConfig());
    BackupManager manager(backupConfig(false), clock.source());

    EXPECT_EQ(manager.createBackup(backend), "");
    EXPECT_FALSE(fs::exists(dir.path() / "backups"));
}

TEST_F(BackupManagerTest, ClosedBackendFailsBackup) {
    SqliteBackend backend(dbConfig());
    backend.close();
    BackupManager manager(backupConfig(), clock.source());

    try {
        manager.createBackup(backend);
        FAIL() << "expected StorageError";
    } catch (const StorageError& e) {
        EXPECT_EQ(e.code(), StorageErrc::BACKUP_FAILED);
    }
}

// ============================================================================
// RETENTION TESTS
// ============================================================================

TEST_F(BackupManagerTest, CleanupRemovesOnlyExpiredArtifacts) {
    touch("health_20240101.db");   // expired
    touch("health_20240214.db");   // cutoff day, expired
    touch("health_20240215.db");   // first day inside the window
    touch("health_20240314.db");
    touch("notes.txt");
    touch("health_bad.db");

    BackupManager manager(backupConfig(true, 30), clock.source());
    EXPECT_EQ(manager.cleanup(), 2u);

    EXPECT_FALSE(exists("health_20240101.db"));
    EXPECT_FALSE(exists("health_20240214.db"));
    EXPECT_TRUE(exists("health_20240215.db"));
    EXPECT_TRUE(exists("health_20240314.db"));
    EXPECT_TRUE(exists("notes.txt"));
    EXPECT_TRUE(exists("health_bad.db"));
}

TEST_F(BackupManagerTest, RetentionOfSevenDaysKeepsSevenDailyFiles) {
    clock.set("20261019120000");
    for (const char* date : {"20261011", "20261012", "20261013", "20261016", "20261019"}) {
        touch(BackupManager::fileNameForDate(date));
    }

    BackupManager manager(backupConfig(true, 7), clock.source());
    EXPECT_EQ(manager.cleanup(), 2u);
    EXPECT_EQ(manager.listBackups(),
              (std::vector<std::string>{"health_20261013.db", "health_20261016.db", "health_20261019.db"}));
}

TEST_F(BackupManagerTest, HugeRetentionKeepsEverything) {
    clock.set("20261019120000");
    touch("health_19700102.db");
    touch("health_20200101.db");
    touch("health_20261012.db");
    touch("health_20261019.db");

    for (int retention : {365000, 2147483647}) {
        BackupManager manager(backupConfig(true, retention), clock.source());
        EXPECT_EQ(manager.cleanup(), 0u) << "retention " << retention;
    }
    EXPECT_EQ(BackupManager(backupConfig(), clock.source()).listBackups().size(), 4u);
}

TEST_F(BackupManagerTest, ZeroRetentionKeepsOnlyToday) {
    touch("health_20240314.db");
    touch("health_20240315.db");

    BackupManager manager(backupConfig(true, 0), clock.source());
    EXPECT_EQ(manager.cleanup(), 1u);
    EXPECT_EQ(manager.listBackups(), (std::vector<std::string>{"health_20240315.db"}));
}

TEST_F(BackupManagerTest, HugeRetentionKeepsFreshBackup) {
    clock.set("20261019120000");
    touch("health_20200101.db");
    SqliteBackend backend(dbConfig());
    BackupManager manager(backupConfig(true, 365000), clock.source());

    manager.createBackup(backend);
    EXPECT_EQ(manager.listBackups(),
              (std::vector<std::string>{"health_20200101.db", "health_20261019.db"}));
}

TEST_F(BackupManagerTest, CreateAppliesRetention) {
    touch("health_20230101.db");
    SqliteBackend backend(dbConfig());
    BackupManager manager(backupConfig(true, 7), clock.source());

    manager.createBackup(backend);
    EXPECT_EQ(manager.listBackups(), (std::vector<std::string>{"health_20240315.db"}));
}

TEST_F(BackupManagerTest, CleanupOfMissingDirectoryIsNotAnError) {
    BackupManager manager(backupConfig(), clock.source());
    EXPECT_EQ(manager.cleanup(), 0u);
    EXPECT_TRUE(manager.listBackups().empty());
}

// ============================================================================
// LIST / FIND / RESTORE TESTS
// ============================================================================

TEST_F(BackupManagerTest, ListIsChronological) {
    touch("health_20240310.db");
    touch("health_20240101.db");
    touch("health_20240205.db");
    touch("readme.md");

    BackupManager manager(backupConfig(), clock.source());
    EXPECT_EQ(manager.listBackups(),
              (std::vector<std::string>{"health_20240101.db", "health_20240205.db", "health_20240310.db"}));
}

TEST_F(BackupManagerTest, FindBackupForDate) {
    touch("health_20240310.db");
    BackupManager manager(backupConfig(), clock.source());

    EXPECT_EQ(manager.findBackupForDate("20240310"), "health_20240310.db");
    try {
        manager.findBackupForDate("20240311");
        FAIL() << "expected StorageError";
    } catch (const StorageError& e) {
        EXPECT_EQ(e.code(), StorageErrc::BACKUP_NOT_FOUND);
    }
}

TEST_F(BackupManagerTest, RestoreCopiesArtifactIntoNewDirectory) {
    std::vector<AggregatedEntry> before;
    {
        SqliteBackend backend(dbConfig());
        backend.writeAggregated({AggregatedEntry{"20240315102300", "db", "latency", 1, 9, 4, 3},
                                 AggregatedEntry{"20240315102300", "web", "hits", 1, 1, 1, 12}});
        backend.flush();
        before = backend.readMetrics("", rangeStart(), rangeEnd());

        BackupManager manager(backupConfig(), clock.source());
        manager.createBackup(backend);
    }

    BackupManager manager(backupConfig(), clock.source());
    const std::string target = dir.file("restored/nested/health.db");
    manager.restore("health_20240315.db", target);

    SqliteConfig restored;
    restored.db_path = target;
    SqliteBackend backend(restored);
    EXPECT_EQ(backend.readMetrics("", rangeStart(), rangeEnd()), before);
}

TEST_F(BackupManagerTest, RestoreMissingArtifactThrowsNotFound) {
    BackupManager manager(backupConfig(), clock.source());
    try {
        manager.restore("health_19990101.db", dir.file("out.db"));
        FAIL() << "expected StorageError";
    } catch (const StorageError& e) {
        EXPECT_EQ(e.code(), StorageErrc::BACKUP_NOT_FOUND);
    }
    EXPECT_THROW(manager.restore("../health.db", dir.file("out.db")), StorageError);
}

TEST_F(BackupManagerTest, InfoReportsConfiguration) {
    BackupManager manager(backupConfig(true, 14), clock.source());
    auto info = manager.info();
    EXPECT_TRUE(info.enabled);
    EXPECT_EQ(info.backup_dir, dir.file("backups"));
    EXPECT_EQ(info.retention_days, 14);
}
