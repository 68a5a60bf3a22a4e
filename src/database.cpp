#include "database.hpp"
#include "skill.hpp"
#include "utils.hpp"
#include <sqlite3.h>
#include <iostream>

namespace skillbook {

namespace {

// Finalizes on scope exit.
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) {
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
            std::string msg = sqlite3_errmsg(db);
            sqlite3_finalize(stmt_);
            stmt_ = nullptr;
            throw PersistenceFailure("prepare failed: " + msg + " [" + sql + "]");
        }
    }
    ~Statement() { if (stmt_) sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(sqlite3* db, const std::vector<Database::Value>& params) {
        for (size_t i = 0; i < params.size(); i++) {
            int idx = static_cast<int>(i) + 1;
            int rc = SQLITE_OK;
            const auto& p = params[i];
            if (std::holds_alternative<std::nullptr_t>(p)) {
                rc = sqlite3_bind_null(stmt_, idx);
            } else if (auto iv = std::get_if<int64_t>(&p)) {
                rc = sqlite3_bind_int64(stmt_, idx, *iv);
            } else if (auto dv = std::get_if<double>(&p)) {
                rc = sqlite3_bind_double(stmt_, idx, *dv);
            } else {
                const auto& s = std::get<std::string>(p);
                rc = sqlite3_bind_text(stmt_, idx, s.c_str(), static_cast<int>(s.size()),
                                       SQLITE_TRANSIENT);
            }
            if (rc != SQLITE_OK) {
                throw PersistenceFailure("bind failed at parameter " + std::to_string(idx) +
                                         ": " + sqlite3_errmsg(db));
            }
        }
    }

    sqlite3_stmt* get() const { return stmt_; }

private:
    sqlite3_stmt* stmt_ = nullptr;
};

Database::Value column_value(sqlite3_stmt* stmt, int col) {
    switch (sqlite3_column_type(stmt, col)) {
        case SQLITE_INTEGER:
            return static_cast<int64_t>(sqlite3_column_int64(stmt, col));
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt, col);
        case SQLITE_NULL:
            return nullptr;
        default: {
            const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
            int bytes = sqlite3_column_bytes(stmt, col);
            return text ? std::string(text, static_cast<size_t>(bytes)) : std::string();
        }
    }
}

} // namespace

Database::Database(const std::string& db_path) : path_(db_path) {
    if (db_path != ":memory:") {
        auto parent = fs::path(db_path).parent_path();
        std::error_code ec;
        if (!parent.empty()) fs::create_directories(parent, ec);
        if (ec) {
            throw PersistenceFailure("Failed to create database directory " + parent.string() +
                                     ": " + ec.message());
        }
    }

    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw PersistenceFailure("Failed to open database " + db_path + ": " + msg);
    }

    sqlite3_busy_timeout(db_, 5000);
    try {
        execute_script("PRAGMA foreign_keys = ON;");
    } catch (const PersistenceFailure&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

Database::~Database() {
    close();
}

void Database::close() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!db_) return;
    if (sqlite3_close(db_) != SQLITE_OK) {
        std::cerr << "[db] Close with unfinalized statements: " << sqlite3_errmsg(db_) << "\n";
        sqlite3_close_v2(db_);
    }
    db_ = nullptr;
}

void Database::require_open() const {
    if (!db_) throw PersistenceFailure("Database " + path_ + " is closed");
}

void Database::fail(const std::string& what) const {
    throw PersistenceFailure(what + ": " + sqlite3_errmsg(db_));
}

void Database::execute(const std::string& sql, const std::vector<Value>& params) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    require_open();

    Statement stmt(db_, sql);
    stmt.bind(db_, params);
    int rc = sqlite3_step(stmt.get());
    while (rc == SQLITE_ROW) rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_DONE) fail("execute failed [" + sql + "]");
}

void Database::execute_script(const std::string& sql) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    require_open();

    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw PersistenceFailure("script failed: " + msg);
    }
}

std::vector<Database::Row> Database::query_all(const std::string& sql,
                                               const std::vector<Value>& params) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    require_open();

    Statement stmt(db_, sql);
    stmt.bind(db_, params);

    std::vector<Row> rows;
    int cols = sqlite3_column_count(stmt.get());
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        Row row;
        row.reserve(static_cast<size_t>(cols));
        for (int c = 0; c < cols; c++) row.push_back(column_value(stmt.get(), c));
        rows.push_back(std::move(row));
    }
    if (rc != SQLITE_DONE) fail("query failed [" + sql + "]");
    return rows;
}

int64_t Database::last_insert_id() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    require_open();
    return sqlite3_last_insert_rowid(db_);
}

int Database::changes() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    require_open();
    return sqlite3_changes(db_);
}

int64_t Database::as_int(const Value& v, int64_t fallback) {
    if (auto iv = std::get_if<int64_t>(&v)) return *iv;
    if (auto dv = std::get_if<double>(&v)) return static_cast<int64_t>(*dv);
    if (auto sv = std::get_if<std::string>(&v)) {
        try {
            return std::stoll(*sv);
        } catch (const std::exception&) {
            return fallback;
        }
    }
    return fallback;
}

std::string Database::as_text(const Value& v) {
    if (auto sv = std::get_if<std::string>(&v)) return *sv;
    if (auto iv = std::get_if<int64_t>(&v)) return std::to_string(*iv);
    if (auto dv = std::get_if<double>(&v)) return std::to_string(*dv);
    return "";
}

// ── Transaction ─────────────────────────────────────────────────────

Database::Transaction::Transaction(Database& db)
    : db_(db), lock_(db.mutex_) {
    db_.execute_script("BEGIN IMMEDIATE;");
}

Database::Transaction::~Transaction() {
    if (done_ || !db_.db_) return;
    char* err = nullptr;
    if (sqlite3_exec(db_.db_, "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
        std::cerr << "[db] Rollback failed: " << (err ? err : "unknown error") << "\n";
    }
    sqlite3_free(err);
}

void Database::Transaction::commit() {
    db_.execute_script("COMMIT;");
    done_ = true;
}

} // namespace skillbook
