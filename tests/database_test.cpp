#include <gtest/gtest.h>
#include <algorithm>

#include "database.hpp"
#include "migrations.hpp"
#include "skill.hpp"
#include "test_helpers.hpp"

using namespace skillbook;
using skillbook::test::TempDirTest;

class DatabaseTest : public TempDirTest {
protected:
    std::string dbPath() const { return (testDir_ / "db" / "test.db").string(); }
};

TEST_F(DatabaseTest, MigrationsCreateTablesAndRecordVersion) {
    Database db(dbPath());
    EXPECT_EQ(stored_schema_version(db), 0);

    run_migrations(db);
    EXPECT_EQ(stored_schema_version(db), kCurrentSchemaVersion);

    auto tables = db.query_all("SELECT name FROM sqlite_master WHERE type = 'table' ORDER BY name");
    std::vector<std::string> names;
    for (const auto& row : tables) names.push_back(Database::as_text(row[0]));
    EXPECT_NE(std::find(names.begin(), names.end(), "skills"), names.end());
    EXPECT_NE(std::find(names.begin(), names.end(), "schema_meta"), names.end());
}

TEST_F(DatabaseTest, MigrationsAreIdempotentAcrossReopen) {
    {
        Database db(dbPath());
        run_migrations(db);
        db.execute("INSERT INTO skills (source, identity_key, name, file_path) VALUES (?, ?, ?, ?)",
                   {std::string("custom"), std::string("k"), std::string("K"), std::string("/x")});
    }
    Database db(dbPath());
    run_migrations(db);
    EXPECT_EQ(stored_schema_version(db), kCurrentSchemaVersion);
    EXPECT_EQ(db.query_all("SELECT id FROM skills").size(), 1u);
}

TEST_F(DatabaseTest, NewerSchemaIsRejected) {
    Database db(dbPath());
    run_migrations(db);
    db.execute("UPDATE schema_meta SET value = ? WHERE key = 'version'",
               {std::to_string(kCurrentSchemaVersion + 1)});
    EXPECT_THROW(run_migrations(db), PersistenceFailure);
}

TEST_F(DatabaseTest, TransactionRollsBackWithoutCommit) {
    Database db(dbPath());
    run_migrations(db);
    {
        Database::Transaction tx(db);
        db.execute("INSERT INTO skills (source, identity_key, name, file_path) VALUES (?, ?, ?, ?)",
                   {std::string("custom"), std::string("k"), std::string("K"), std::string("/x")});
    }
    EXPECT_TRUE(db.query_all("SELECT id FROM skills").empty());
}

TEST_F(DatabaseTest, BadSqlThrowsPersistenceFailure) {
    Database db(dbPath());
    EXPECT_THROW(db.execute("INSERT INTO nowhere VALUES (1)"), PersistenceFailure);
    EXPECT_THROW(db.query_all("SELEC nonsense"), PersistenceFailure);
}

TEST_F(DatabaseTest, ClosedDatabaseThrows) {
    Database db(dbPath());
    EXPECT_TRUE(db.is_open());
    db.close();
    EXPECT_FALSE(db.is_open());
    EXPECT_THROW(db.query_all("SELECT 1"), PersistenceFailure);
}

TEST_F(DatabaseTest, ValuesRoundTripThroughQueries) {
    Database db(dbPath());
    auto rows = db.query_all("SELECT ?, ?, ?, ?",
                             {int64_t{42}, 1.5, std::string("text"), nullptr});
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(Database::as_int(rows[0][0]), 42);
    EXPECT_DOUBLE_EQ(std::get<double>(rows[0][1]), 1.5);
    EXPECT_EQ(Database::as_text(rows[0][2]), "text");
    EXPECT_TRUE(Database::is_null(rows[0][3]));
}
