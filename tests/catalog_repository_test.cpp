#include <gtest/gtest.h>
#include <memory>

#include "catalog_repository.hpp"
#include "migrations.hpp"
#include "test_helpers.hpp"

using namespace skillbook;
using skillbook::test::TempDirTest;

class CatalogRepositoryTest : public TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        database_ = std::make_shared<Database>((testDir_ / "catalog.db").string());
        run_migrations(*database_);
        repo_ = std::make_unique<CatalogRepository>(database_);
    }

    void TearDown() override {
        repo_.reset();
        database_.reset();
        TempDirTest::TearDown();
    }

    static SkillRecord makeRecord(SourceKind source, const std::string& key,
                                  const std::string& name) {
        SkillRecord r;
        r.source = source;
        r.identity_key = key;
        r.name = name;
        r.description = name + " description";
        r.body_text = "body of " + name;
        r.file_path = "/skills/" + key + "/SKILL.md";
        return r;
    }

    std::shared_ptr<Database> database_;
    std::unique_ptr<CatalogRepository> repo_;
};

TEST_F(CatalogRepositoryTest, InsertAssignsFreshIds) {
    auto a = makeRecord(SourceKind::official, "a", "A");
    auto b = makeRecord(SourceKind::custom, "b", "B");
    b.command = "/b";
    b.verified = true;

    auto ids = repo_->apply_batch({a, b}, {}, {});
    ASSERT_EQ(ids.size(), 2u);
    EXPECT_NE(ids[0], ids[1]);

    auto all = repo_->list_all();
    ASSERT_EQ(all.size(), 2u);
    auto stored = repo_->find(ids[1]);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->source, SourceKind::custom);
    EXPECT_EQ(stored->identity_key, "b");
    ASSERT_TRUE(stored->command.has_value());
    EXPECT_EQ(*stored->command, "/b");
    EXPECT_TRUE(stored->verified);
    EXPECT_TRUE(stored->is_enabled);
    EXPECT_GT(stored->created_at, 0);
    EXPECT_FALSE(repo_->find(ids[0])->command.has_value());
}

TEST_F(CatalogRepositoryTest, UpdateNeverTouchesProtectedColumns) {
    auto ids = repo_->apply_batch({makeRecord(SourceKind::official, "a", "A")}, {}, {});
    ASSERT_TRUE(repo_->set_enabled(ids[0], false));

    SkillRecord update = makeRecord(SourceKind::custom, "other-key", "Renamed");
    update.id = ids[0];
    update.is_enabled = true;
    repo_->apply_batch({}, {update}, {});

    auto stored = repo_->find(ids[0]);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->name, "Renamed");
    EXPECT_EQ(stored->source, SourceKind::official);
    EXPECT_EQ(stored->identity_key, "a");
    EXPECT_FALSE(stored->is_enabled);
}

TEST_F(CatalogRepositoryTest, DeleteRemovesRowAndIdIsNotReused) {
    auto ids = repo_->apply_batch({makeRecord(SourceKind::custom, "a", "A")}, {}, {});
    repo_->apply_batch({}, {}, {ids[0]});
    EXPECT_TRUE(repo_->list_all().empty());
    EXPECT_FALSE(repo_->find(ids[0]).has_value());

    auto again = repo_->apply_batch({makeRecord(SourceKind::custom, "a", "A")}, {}, {});
    EXPECT_GT(again[0], ids[0]);
}

TEST_F(CatalogRepositoryTest, SameKeyUnderDifferentSourcesIsAllowed) {
    auto ids = repo_->apply_batch({makeRecord(SourceKind::official, "same", "Official"),
                                   makeRecord(SourceKind::custom, "same", "Custom")},
                                  {}, {});
    EXPECT_EQ(ids.size(), 2u);
    EXPECT_EQ(repo_->list_all().size(), 2u);
}

TEST_F(CatalogRepositoryTest, FailedBatchRollsBackEverything) {
    auto ids = repo_->apply_batch({makeRecord(SourceKind::custom, "keep", "Keep")}, {}, {});

    SkillRecord update = makeRecord(SourceKind::custom, "keep", "Changed");
    update.id = ids[0];
    // Duplicate (source, identity_key) violates the unique constraint
    auto dup = makeRecord(SourceKind::custom, "keep", "Duplicate");

    EXPECT_THROW(repo_->apply_batch({dup}, {update}, {}), PersistenceFailure);

    auto all = repo_->list_all();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].name, "Keep");
}

TEST_F(CatalogRepositoryTest, UpdateOfUnknownIdFails) {
    SkillRecord ghost = makeRecord(SourceKind::custom, "ghost", "Ghost");
    ghost.id = 999;
    EXPECT_THROW(repo_->apply_batch({}, {ghost}, {}), PersistenceFailure);
}

TEST_F(CatalogRepositoryTest, SetEnabledReportsUnknownIds) {
    EXPECT_FALSE(repo_->set_enabled(12345, false));

    auto ids = repo_->apply_batch({makeRecord(SourceKind::custom, "t", "T")}, {}, {});
    EXPECT_TRUE(repo_->set_enabled(ids[0], false));
    EXPECT_FALSE(repo_->find(ids[0])->is_enabled);
}
