#pragma once
#include <string>
#include <vector>
#include <variant>
#include <mutex>
#include <cstdint>
#include <cstddef>

struct sqlite3;

namespace skillbook {

// Thin wrapper over one sqlite3 connection. Every call takes the connection
// mutex, so one Database can be shared between threads and managers.
// Errors throw PersistenceFailure.
class Database {
public:
    using Value = std::variant<std::nullptr_t, int64_t, double, std::string>;
    using Row = std::vector<Value>;

    explicit Database(const std::string& db_path);
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    // Run one statement with positional `?` parameters
    void execute(const std::string& sql, const std::vector<Value>& params = {});

    // Run several `;`-separated statements without parameters
    void execute_script(const std::string& sql);

    std::vector<Row> query_all(const std::string& sql, const std::vector<Value>& params = {});

    int64_t last_insert_id();
    int changes();

    bool is_open() const { return db_ != nullptr; }
    void close();
    const std::string& path() const { return path_; }

    std::recursive_mutex& mutex() { return mutex_; }

    // BEGIN IMMEDIATE on construction, ROLLBACK on destruction unless commit()
    // was called. Holds the connection mutex for its whole lifetime.
    class Transaction {
    public:
        explicit Transaction(Database& db);
        ~Transaction();

        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;

        void commit();

    private:
        Database& db_;
        std::unique_lock<std::recursive_mutex> lock_;
        bool done_ = false;
    };

    static int64_t as_int(const Value& v, int64_t fallback = 0);
    static std::string as_text(const Value& v);
    static bool is_null(const Value& v) { return std::holds_alternative<std::nullptr_t>(v); }

private:
    sqlite3* db_ = nullptr;
    std::string path_;
    std::recursive_mutex mutex_;

    void require_open() const;
    [[noreturn]] void fail(const std::string& what) const;
};

} // namespace skillbook
