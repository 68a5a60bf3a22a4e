#pragma once
#include "database.hpp"

namespace skillbook {

inline constexpr int kCurrentSchemaVersion = 1;

// Version recorded in schema_meta, 0 for a fresh database.
int stored_schema_version(Database& db);

// Bring the database up to kCurrentSchemaVersion in one transaction.
// Throws PersistenceFailure if the database was written by a newer schema.
void run_migrations(Database& db);

} // namespace skillbook
