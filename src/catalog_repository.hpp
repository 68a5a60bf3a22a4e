#pragma once
#include "skill.hpp"
#include "database.hpp"
#include <memory>
#include <vector>
#include <optional>
#include <cstdint>

namespace skillbook {

// Persistence boundary for the `skills` table. Expects run_migrations() to
// have been applied to the database.
class CatalogRepository {
public:
    explicit CatalogRepository(std::shared_ptr<Database> db);

    std::vector<SkillRecord> list_all();
    std::optional<SkillRecord> find(int64_t id);

    // Applies inserts, updates and deletes as one transaction and returns the
    // ids assigned to `inserts`, in order. Updates match on id and never touch
    // source, identity_key, is_enabled or created_at. Throws
    // PersistenceFailure after rolling back if any statement fails.
    std::vector<int64_t> apply_batch(const std::vector<SkillRecord>& inserts,
                                     const std::vector<SkillRecord>& updates,
                                     const std::vector<int64_t>& deletes);

    // False when no row has this id
    bool set_enabled(int64_t id, bool enabled);

    Database& database() { return *db_; }

private:
    std::shared_ptr<Database> db_;

    static SkillRecord from_row(const Database::Row& row);
};

} // namespace skillbook
