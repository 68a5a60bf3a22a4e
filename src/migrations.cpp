#include "migrations.hpp"
#include "skill.hpp"
#include <iostream>

namespace skillbook {

namespace {

struct Migration {
    int version;
    const char* sql;
};

const Migration kMigrations[] = {
    {1, R"SQL(
        CREATE TABLE IF NOT EXISTS skills (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            source TEXT NOT NULL CHECK (source IN ('official', 'custom')),
            identity_key TEXT NOT NULL,
            name TEXT NOT NULL,
            description TEXT NOT NULL DEFAULT '',
            command TEXT,
            verified INTEGER NOT NULL DEFAULT 0,
            body_text TEXT NOT NULL DEFAULT '',
            is_enabled INTEGER NOT NULL DEFAULT 1,
            file_path TEXT NOT NULL,
            created_at INTEGER NOT NULL DEFAULT 0,
            updated_at INTEGER NOT NULL DEFAULT 0,
            UNIQUE (source, identity_key)
        );
        CREATE INDEX IF NOT EXISTS idx_skills_enabled ON skills (is_enabled);
    )SQL"},
};

void ensure_meta_table(Database& db) {
    db.execute_script(R"SQL(
        CREATE TABLE IF NOT EXISTS schema_meta (
            key TEXT PRIMARY KEY,
            value TEXT NOT NULL
        );
    )SQL");
}

} // namespace

int stored_schema_version(Database& db) {
    ensure_meta_table(db);
    auto rows = db.query_all("SELECT value FROM schema_meta WHERE key = 'version'");
    if (rows.empty() || rows[0].empty()) return 0;
    return static_cast<int>(Database::as_int(rows[0][0], 0));
}

void run_migrations(Database& db) {
    std::lock_guard<std::recursive_mutex> lock(db.mutex());

    int version = stored_schema_version(db);
    if (version > kCurrentSchemaVersion) {
        throw PersistenceFailure("Database schema version " + std::to_string(version) +
                                 " is newer than supported version " +
                                 std::to_string(kCurrentSchemaVersion));
    }
    if (version == kCurrentSchemaVersion) return;

    Database::Transaction tx(db);
    for (const auto& m : kMigrations) {
        if (m.version <= version) continue;
        db.execute_script(m.sql);
        std::cerr << "[db] Applied schema migration " << m.version << "\n";
    }
    db.execute("INSERT OR REPLACE INTO schema_meta (key, value) VALUES ('version', ?)",
               {std::to_string(kCurrentSchemaVersion)});
    tx.commit();
}

} // namespace skillbook
