#include "core/index/migration.h"
#include "core/shared/logging.h"
#include <sqlite3.h>
#include <string>

namespace rp {

int currentSchemaVersion(sqlite3* db)
{
    const char* sql = "SELECT value FROM settings WHERE key = 'schema_version'";
    sqlite3_stmt* stmt = nullptr;
    int version = 0;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) == SQLITE_OK) {
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            const char* val = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
            if (val) {
                try {
                    version = std::stoi(val);
                } catch (const std::exception&) {
                    LOG_WARN(rpStore, "Unparseable schema_version '%s', treating as 0", val);
                    version = 0;
                }
            }
        }
    }
    sqlite3_finalize(stmt);
    return version;
}

bool applyMigrations(sqlite3* db, int targetVersion)
{
    int current = currentSchemaVersion(db);

    if (current > targetVersion) {
        LOG_ERROR(rpStore, "Schema version %d is newer than app version %d, downgrade not supported",
                  current, targetVersion);
        return false;
    }

    if (current == targetVersion) {
        return true;
    }

    auto exec = [db](const char* sql) -> bool {
        char* errMsg = nullptr;
        const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
        if (rc != SQLITE_OK) {
            LOG_ERROR(rpStore, "Migration SQL failed: %s", errMsg ? errMsg : "unknown");
            sqlite3_free(errMsg);
            return false;
        }
        return true;
    };

    if (current < 2 && targetVersion >= 2) {
        LOG_INFO(rpStore, "Applying schema migration 1 -> 2");

        // Failed runs carry a machine-readable code next to the message, and
        // custom interests get an independent weight.
        if (!exec("SAVEPOINT migrate_v2")) {
            return false;
        }
        const bool ok =
            exec("ALTER TABLE recommendation_runs ADD COLUMN error_code TEXT;")
            && exec("ALTER TABLE custom_interests ADD COLUMN weight REAL NOT NULL DEFAULT 1.0;")
            && exec("CREATE INDEX IF NOT EXISTS idx_runs_status ON recommendation_runs(status);")
            && exec("INSERT OR REPLACE INTO settings (key, value) VALUES ('schema_version', '2');");
        if (!ok) {
            exec("ROLLBACK TO SAVEPOINT migrate_v2");
            exec("RELEASE SAVEPOINT migrate_v2");
            return false;
        }
        if (!exec("RELEASE SAVEPOINT migrate_v2")) {
            return false;
        }

        current = 2;
    }

    if (current < 3 && targetVersion >= 3) {
        LOG_INFO(rpStore, "Applying schema migration 2 -> 3");

        // Runs record their owning process and a heartbeat so another process
        // can tell a live run from an abandoned one. Items carry a network,
        // users opt in per media type.
        if (!exec("SAVEPOINT migrate_v3")) {
            return false;
        }
        const bool ok =
            exec("ALTER TABLE recommendation_runs ADD COLUMN owner_pid INTEGER;")
            && exec("ALTER TABLE recommendation_runs ADD COLUMN heartbeat_at REAL;")
            && exec("UPDATE recommendation_runs SET heartbeat_at = created_at;")
            && exec("ALTER TABLE items ADD COLUMN network TEXT;")
            && exec("ALTER TABLE users ADD COLUMN movies_enabled INTEGER NOT NULL DEFAULT 1;")
            && exec("ALTER TABLE users ADD COLUMN series_enabled INTEGER NOT NULL DEFAULT 1;")
            && exec("INSERT OR REPLACE INTO settings (key, value) VALUES ('schema_version', '3');");
        if (!ok) {
            exec("ROLLBACK TO SAVEPOINT migrate_v3");
            exec("RELEASE SAVEPOINT migrate_v3");
            return false;
        }
        if (!exec("RELEASE SAVEPOINT migrate_v3")) {
            return false;
        }

        current = 3;
    }

    if (current != targetVersion) {
        LOG_ERROR(rpStore, "Schema migration incomplete: current=%d target=%d",
                  current, targetVersion);
        return false;
    }

    LOG_INFO(rpStore, "Schema migrations complete: version %d", current);
    return true;
}

} // namespace rp
