#include <healthstream/core/storage/migrations.hpp>
#include <healthstream/core/storage/storage_error.hpp>
#include <sqlite3.h>
#include <spdlog/spdlog.h>
#include <string>

namespace HealthStream {

namespace {

void exec(sqlite3* db, const char* sql, const char* what) {
    char* err_msg = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        std::string msg = std::string(what) + ": " + (err_msg ? err_msg : sqlite3_errstr(rc));
        sqlite3_free(err_msg);
        throw StorageError(StorageErrc::BACKEND_UNAVAILABLE, msg);
    }
}

void recordVersion(sqlite3* db, int version) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, "INSERT INTO schema_migrations (version) VALUES (?)", -1, &stmt, nullptr);
    if (rc == SQLITE_OK) {
        sqlite3_bind_int(stmt, 1, version);
        rc = sqlite3_step(stmt);
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        throw StorageError(StorageErrc::BACKEND_UNAVAILABLE,
                           "failed to record migration " + std::to_string(version) + ": " + sqlite3_errmsg(db));
    }
}

} // namespace

const std::vector<SqliteMigration>& MigrationRunner::migrations() {
    static const std::vector<SqliteMigration> list = {
        {
            1,
            R"(
                CREATE TABLE metrics (
                    id INTEGER PRIMARY KEY AUTOINCREMENT,
                    timestamp INTEGER NOT NULL,
                    component TEXT NOT NULL,
                    name TEXT NOT NULL,
                    value REAL NOT NULL,
                    type TEXT NOT NULL,
                    created_at INTEGER DEFAULT (strftime('%s', 'now'))
                );
                CREATE INDEX idx_metrics_time_component ON metrics(timestamp, component);
                CREATE INDEX idx_metrics_component_name ON metrics(component, name);
            )",
            "DROP TABLE IF EXISTS metrics;"
        },
        {
            2,
            R"(
                CREATE TABLE time_series_metrics (
                    time_window_key TEXT NOT NULL,
                    component TEXT NOT NULL,
                    metric TEXT NOT NULL,
                    min_value REAL NOT NULL,
                    max_value REAL NOT NULL,
                    avg_value REAL NOT NULL,
                    count INTEGER NOT NULL,
                    created_at INTEGER DEFAULT (strftime('%s', 'now')),
                    PRIMARY KEY (time_window_key, component, metric)
                );
                CREATE INDEX idx_time_series_component ON time_series_metrics(component);
                CREATE INDEX idx_time_series_window ON time_series_metrics(time_window_key);
            )",
            "DROP TABLE IF EXISTS time_series_metrics;"
        },
    };
    return list;
}

int MigrationRunner::latestVersion() {
    return migrations().empty() ? 0 : migrations().back().version;
}

int MigrationRunner::currentVersion(sqlite3* db) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, "SELECT COALESCE(MAX(version), 0) FROM schema_migrations", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw StorageError(StorageErrc::QUERY_FAILED,
                           std::string("failed to read schema version: ") + sqlite3_errmsg(db));
    }

    int version = 0;
    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        version = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_ROW) {
        throw StorageError(StorageErrc::QUERY_FAILED,
                           std::string("failed to read schema version: ") + sqlite3_errmsg(db));
    }
    return version;
}

void MigrationRunner::run(sqlite3* db) {
    exec(db, R"(
        CREATE TABLE IF NOT EXISTS schema_migrations (
            version INTEGER PRIMARY KEY,
            applied_at INTEGER NOT NULL DEFAULT (strftime('%s', 'now'))
        )
    )", "failed to create migrations table");

    int current = currentVersion(db);

    for (const auto& m : migrations()) {
        if (m.version <= current) {
            continue;
        }

        exec(db, "BEGIN IMMEDIATE", "failed to begin migration");
        try {
            exec(db, m.up, "failed to execute migration SQL");
            recordVersion(db, m.version);
            exec(db, "COMMIT", "failed to commit migration");
        } catch (const StorageError&) {
            sqlite3_exec(db, "ROLLBACK", nullptr, nullptr, nullptr);
            spdlog::error("[Migrations] Version {} failed, rolled back", m.version);
            throw;
        }
        spdlog::info("[Migrations] Applied schema version {}", m.version);
    }
}

} // namespace HealthStream
