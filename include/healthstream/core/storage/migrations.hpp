#pragma once

#include <vector>

struct sqlite3;

namespace HealthStream {

struct SqliteMigration {
    int version;
    const char* up;
    const char* down;  // rollback SQL, informational
};

/**
 * @brief Ordered, idempotent schema migrations tracked in schema_migrations
 *
 * Each pending migration runs inside its own transaction together with the
 * insert of its version row. Applied versions are skipped.
 */
class MigrationRunner {
public:
    static const std::vector<SqliteMigration>& migrations();

    // Throws StorageError(BACKEND_UNAVAILABLE) on failure
    static void run(sqlite3* db);

    // Highest applied version, 0 on a fresh database
    static int currentVersion(sqlite3* db);

    static int latestVersion();
};

} // namespace HealthStream
