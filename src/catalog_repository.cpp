#include "catalog_repository.hpp"
#include "utils.hpp"

namespace skillbook {

namespace {

const char* kSelectColumns =
    "SELECT id, source, identity_key, name, description, command, verified, body_text, "
    "is_enabled, file_path, created_at, updated_at FROM skills";

Database::Value optional_text(const std::optional<std::string>& v) {
    if (!v) return nullptr;
    return *v;
}

} // namespace

CatalogRepository::CatalogRepository(std::shared_ptr<Database> db)
    : db_(std::move(db)) {
    if (!db_) throw PersistenceFailure("CatalogRepository requires a database");
}

SkillRecord CatalogRepository::from_row(const Database::Row& row) {
    SkillRecord r;
    r.id = Database::as_int(row[0]);
    auto kind = parse_source_kind(Database::as_text(row[1]));
    if (!kind) {
        throw PersistenceFailure("Skill row " + std::to_string(r.id) + " has unknown source '" +
                                 Database::as_text(row[1]) + "'");
    }
    r.source = *kind;
    r.identity_key = Database::as_text(row[2]);
    r.name = Database::as_text(row[3]);
    r.description = Database::as_text(row[4]);
    if (!Database::is_null(row[5])) r.command = Database::as_text(row[5]);
    r.verified = Database::as_int(row[6]) != 0;
    r.body_text = Database::as_text(row[7]);
    r.is_enabled = Database::as_int(row[8], 1) != 0;
    r.file_path = Database::as_text(row[9]);
    r.created_at = Database::as_int(row[10]);
    r.updated_at = Database::as_int(row[11]);
    return r;
}

std::vector<SkillRecord> CatalogRepository::list_all() {
    std::vector<SkillRecord> out;
    for (const auto& row : db_->query_all(std::string(kSelectColumns) + " ORDER BY id")) {
        out.push_back(from_row(row));
    }
    return out;
}

std::optional<SkillRecord> CatalogRepository::find(int64_t id) {
    auto rows = db_->query_all(std::string(kSelectColumns) + " WHERE id = ?", {id});
    if (rows.empty()) return std::nullopt;
    return from_row(rows.front());
}

std::vector<int64_t> CatalogRepository::apply_batch(const std::vector<SkillRecord>& inserts,
                                                    const std::vector<SkillRecord>& updates,
                                                    const std::vector<int64_t>& deletes) {
    std::vector<int64_t> ids;
    ids.reserve(inserts.size());
    if (inserts.empty() && updates.empty() && deletes.empty()) return ids;

    int64_t now = epoch_now();
    Database::Transaction tx(*db_);

    for (int64_t id : deletes) {
        db_->execute("DELETE FROM skills WHERE id = ?", {id});
    }

    for (const auto& r : updates) {
        db_->execute(
            "UPDATE skills SET name = ?, description = ?, command = ?, verified = ?, "
            "body_text = ?, file_path = ?, updated_at = ? WHERE id = ?",
            {r.name, r.description, optional_text(r.command),
             static_cast<int64_t>(r.verified ? 1 : 0), r.body_text, r.file_path, now, r.id});
        if (db_->changes() == 0) {
            throw PersistenceFailure("Update matched no skill with id " + std::to_string(r.id));
        }
    }

    for (const auto& r : inserts) {
        db_->execute(
            "INSERT INTO skills (source, identity_key, name, description, command, verified, "
            "body_text, is_enabled, file_path, created_at, updated_at) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
            {source_kind_name(r.source), r.identity_key, r.name, r.description,
             optional_text(r.command), static_cast<int64_t>(r.verified ? 1 : 0), r.body_text,
             static_cast<int64_t>(r.is_enabled ? 1 : 0), r.file_path, now, now});
        ids.push_back(db_->last_insert_id());
    }

    tx.commit();
    return ids;
}

bool CatalogRepository::set_enabled(int64_t id, bool enabled) {
    Database::Transaction tx(*db_);
    db_->execute("UPDATE skills SET is_enabled = ?, updated_at = ? WHERE id = ?",
                 {static_cast<int64_t>(enabled ? 1 : 0), epoch_now(), id});
    bool matched = db_->changes() > 0;
    tx.commit();
    return matched;
}

} // namespace skillbook
