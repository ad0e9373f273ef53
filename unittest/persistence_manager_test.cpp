// ============================================================================
// PERSISTENCE MANAGER UNIT TESTS
// ============================================================================
// Tests for backend selection, graceful degradation and backups
// ============================================================================

#include <gtest/gtest.h>
#include <healthstream/core/storage/memory_backend.hpp>
#include <healthstream/core/storage/persistence_manager.hpp>
#include <healthstream/core/storage/sqlite_backend.hpp>
#include "support/test_support.hpp"
#include <filesystem>
#include <functional>

using namespace HealthStream;
using namespace HealthStream::Testing;

namespace fs = std::filesystem;

// ============================================================================
// TEST CLASS
// ============================================================================
class PersistenceManagerTest : public ::testing::Test {
protected:
    TempDir dir{"persistence"};

    PersistenceConfig sqliteConfig(bool backup = false) {
        PersistenceConfig c;
        c.enabled = true;
        c.db_path = dir.file("health.db");
        c.backup.enabled = backup;
        c.backup.backup_dir = dir.file("backups");
        return c;
    }

    static StorageErrc codeOf(const std::function<void()>& fn) {
        try {
            fn();
        } catch (const StorageError& e) {
            return e.code();
        }
        ADD_FAILURE() << "expected StorageError";
        return StorageErrc::NOT_ENABLED;
    }
};

// ============================================================================
// BACKEND SELECTION TESTS
// ============================================================================

TEST_F(PersistenceManagerTest, DisabledByDefault) {
    auto pm = PersistenceManager::create(PersistenceConfig{});
    EXPECT_FALSE(pm->isEnabled());
    EXPECT_EQ(pm->backend(), nullptr);

    // Writes are silently ignored
    EXPECT_NO_THROW(pm->persistMetric("db", "latency", 1.0, MetricKind::MEASUREMENT));
    EXPECT_NO_THROW(pm->persistAggregated({AggregatedEntry{"20240315102300", "db", "x", 1, 1, 1, 1}}));
    EXPECT_NO_THROW(pm->forceFlush());

    EXPECT_EQ(codeOf([&]() { pm->readMetrics("", rangeStart(), rangeEnd()); }), StorageErrc::NOT_ENABLED);
    EXPECT_EQ(codeOf([&]() { pm->listComponents(); }), StorageErrc::NOT_ENABLED);
}

TEST_F(PersistenceManagerTest, EmptyPathSelectsMemoryBackend) {
    PersistenceConfig c;
    c.enabled = true;
    c.db_path = "";
    auto pm = PersistenceManager::create(c);
    ASSERT_TRUE(pm->isEnabled());
    EXPECT_NE(dynamic_cast<MemoryBackend*>(pm->backend()), nullptr);
}

TEST_F(PersistenceManagerTest, FilePathSelectsSqliteBackend) {
    auto pm = PersistenceManager::create(sqliteConfig());
    ASSERT_TRUE(pm->isEnabled());
    EXPECT_NE(dynamic_cast<SqliteBackend*>(pm->backend()), nullptr);
    EXPECT_TRUE(fs::exists(dir.file("health.db")));
}

TEST_F(PersistenceManagerTest, UnwritablePathDegradesToDisabled) {
    PersistenceConfig c;
    c.enabled = true;
    c.db_path = "/nonexistent_healthstream_dir/sub/health.db";

    std::unique_ptr<PersistenceManager> pm;
    ASSERT_NO_THROW(pm = PersistenceManager::create(c));
    EXPECT_FALSE(pm->isEnabled());
    EXPECT_EQ(codeOf([&]() { pm->readMetrics("", rangeStart(), rangeEnd()); }), StorageErrc::NOT_ENABLED);
}

// ============================================================================
// WRITE PATH TESTS
// ============================================================================

TEST_F(PersistenceManagerTest, RawPointsAreAggregatedBeforeStorage) {
    ManualClock clock{"20240315102310"};
    PersistenceConfig c;
    c.enabled = true;
    PersistenceManager pm(std::make_unique<MemoryBackend>(), c, clock.source());

    pm.persistMetric("web", "hits", 0.0, MetricKind::COUNTER);
    pm.persistMetric("web", "hits", 0.0, MetricKind::COUNTER);
    pm.persistMetric("web", "hits", 0.0, MetricKind::COUNTER);
    pm.persistMetric("", "latency", 8.0, MetricKind::MEASUREMENT);
    EXPECT_EQ(pm.queuedPoints(), 4u);

    pm.forceFlush();
    auto rows = pm.readMetrics("", rangeStart(), rangeEnd());
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].component, GLOBAL_COMPONENT);
    EXPECT_DOUBLE_EQ(rows[0].avg, 8.0);
    EXPECT_EQ(rows[1].component, "web");
    EXPECT_TRUE(rows[1].isCounter());
    EXPECT_EQ(rows[1].count, 3u);
    EXPECT_EQ(pm.listComponents(), (std::vector<std::string>{GLOBAL_COMPONENT, "web"}));
}

TEST_F(PersistenceManagerTest, BatchOfPointsPersisted) {
    auto t = *WindowKey::toTime("20240315102310");
    PersistenceConfig c;
    c.enabled = true;
    PersistenceManager pm(std::make_unique<MemoryBackend>(), c);

    pm.persistMetrics({RawMetricPoint{t, "db", "latency", 2.0, MetricKind::MEASUREMENT},
                       RawMetricPoint{t, "db", "latency", 4.0, MetricKind::MEASUREMENT}});
    pm.forceFlush();

    auto rows = pm.readMetrics("db", rangeStart(), rangeEnd());
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_DOUBLE_EQ(rows[0].avg, 3.0);
    EXPECT_EQ(rows[0].count, 2u);
}

TEST_F(PersistenceManagerTest, AggregatedEntriesReachSqlite) {
    auto pm = PersistenceManager::create(sqliteConfig());
    pm->persistAggregated({AggregatedEntry{"20240315102300", "db", "latency", 1, 5, 3, 5}});
    pm->forceFlush();

    auto rows = pm->readMetrics("db", rangeStart(), rangeEnd());
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].count, 5u);
}

TEST_F(PersistenceManagerTest, ReadsAfterCloseFail) {
    auto pm = PersistenceManager::create(sqliteConfig());
    pm->close();
    EXPECT_TRUE(pm->isClosed());
    EXPECT_EQ(codeOf([&]() { pm->listComponents(); }), StorageErrc::CLOSED);
    EXPECT_NO_THROW(pm->close());
}

// ============================================================================
// BACKUP TESTS
// ============================================================================

TEST_F(PersistenceManagerTest, BackupOperationsRequireBackupEnabled) {
    auto pm = PersistenceManager::create(sqliteConfig(false));
    EXPECT_EQ(pm->createBackup(), "");
    EXPECT_EQ(codeOf([&]() { pm->listBackups(); }), StorageErrc::BACKUP_DISABLED);
    EXPECT_EQ(codeOf([&]() { pm->restoreFromBackup("health_20240101.db", dir.file("x.db")); }),
              StorageErrc::BACKUP_DISABLED);
    EXPECT_FALSE(pm->backupInfo().enabled);
}

TEST_F(PersistenceManagerTest, MemoryBackendHasNothingToBackUp) {
    PersistenceConfig c;
    c.enabled = true;
    c.db_path = "";
    c.backup.enabled = true;
    c.backup.backup_dir = dir.file("backups");
    auto pm = PersistenceManager::create(c);

    EXPECT_EQ(pm->createBackup(), "");
    EXPECT_TRUE(pm->listBackups().empty());
}

TEST_F(PersistenceManagerTest, BackupRoundTripPreservesReads) {
    auto pm = PersistenceManager::create(sqliteConfig(true));
    pm->persistAggregated({AggregatedEntry{"20240315102300", "db", "latency", 1, 9, 4, 3},
                           AggregatedEntry{"20240315102400", "web", "hits", 1, 1, 1, 7}});

    // createBackup flushes queued writes first
    auto path = pm->createBackup();
    ASSERT_FALSE(path.empty());
    auto before = pm->readMetrics("", rangeStart(), rangeEnd());
    ASSERT_EQ(before.size(), 2u);

    auto backups = pm->listBackups();
    ASSERT_EQ(backups.size(), 1u);
    EXPECT_EQ(pm->findBackupForDate(*BackupManager::parseFileDate(backups[0])), backups[0]);

    const std::string target = dir.file("restore/health.db");
    pm->restoreFromBackup(backups[0], target);

    PersistenceConfig rc;
    rc.enabled = true;
    rc.db_path = target;
    auto restored = PersistenceManager::create(rc);
    EXPECT_EQ(restored->readMetrics("", rangeStart(), rangeEnd()), before);
}

TEST_F(PersistenceManagerTest, CloseTakesBackup) {
    {
        auto pm = PersistenceManager::create(sqliteConfig(true));
        pm->persistAggregated({AggregatedEntry{"20240315102300", "db", "latency", 2, 2, 2, 1}});
        pm->close();
    }

    BackupConfig bc;
    bc.enabled = true;
    bc.backup_dir = dir.file("backups");
    BackupManager manager(bc);
    auto backups = manager.listBackups();
    ASSERT_EQ(backups.size(), 1u);

    SqliteConfig copy;
    copy.db_path = dir.file("backups/" + backups[0]);
    SqliteBackend snapshot(copy);
    EXPECT_EQ(snapshot.readMetrics("", rangeStart(), rangeEnd()).size(), 1u);
}
