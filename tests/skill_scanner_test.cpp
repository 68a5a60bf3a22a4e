#include <gtest/gtest.h>
#include <algorithm>

#include "skill_scanner.hpp"
#include "test_helpers.hpp"

using namespace skillbook;
using skillbook::test::TempDirTest;

class SkillScannerTest : public TempDirTest {};

TEST_F(SkillScannerTest, MissingRootYieldsNothing) {
    SkillScanner scanner((testDir_ / "does-not-exist").string(), SourceKind::custom);
    EXPECT_FALSE(scanner.next().has_value());
    EXPECT_FALSE(scanner.next().has_value());
}

TEST_F(SkillScannerTest, FindsOneCandidatePerSkillDirectory) {
    writeSkill(bundledDir_, "alpha", "Alpha", "a");
    writeSkill(bundledDir_, "beta", "Beta", "b");

    auto found = SkillScanner::collect(bundledDir_.string(), SourceKind::official);
    ASSERT_EQ(found.size(), 2u);

    std::sort(found.begin(), found.end(),
              [](const SkillCandidate& a, const SkillCandidate& b) {
                  return a.relative_key < b.relative_key;
              });
    EXPECT_EQ(found[0].relative_key, "alpha");
    EXPECT_EQ(found[1].relative_key, "beta");
    for (const auto& c : found) {
        EXPECT_EQ(c.source, SourceKind::official);
        EXPECT_TRUE(fs::path(c.path).is_absolute());
        EXPECT_EQ(fs::path(c.path).filename().string(), "SKILL.md");
        EXPECT_TRUE(fs::exists(c.path));
    }
}

TEST_F(SkillScannerTest, SkipsDirectoriesWithoutSkillFile) {
    writeSkill(userDir_, "real", "Real", "r");
    writeFile(userDir_ / "assets" / "logo.png", "png");
    writeFile(userDir_ / "README.md", "loose file at root");
    fs::create_directories(userDir_ / "empty");

    auto found = SkillScanner::collect(userDir_.string(), SourceKind::custom);
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].relative_key, "real");
    EXPECT_EQ(found[0].source, SourceKind::custom);
}

TEST_F(SkillScannerTest, SkipsHiddenDirectoriesAndNonRegularSkillFiles) {
    writeSkill(userDir_, ".trash", "Trash", "hidden");
    fs::create_directories(userDir_ / "weird" / "SKILL.md");

    EXPECT_TRUE(SkillScanner::collect(userDir_.string(), SourceKind::custom).empty());
}

TEST_F(SkillScannerTest, DoesNotRecurseIntoNestedDirectories) {
    writeSkill(bundledDir_ / "group", "nested", "Nested", "too deep");

    EXPECT_TRUE(SkillScanner::collect(bundledDir_.string(), SourceKind::official).empty());
}

TEST_F(SkillScannerTest, CandidateStreamChainsRootsInOrder) {
    writeSkill(bundledDir_, "one", "One", "1");
    writeSkill(userDir_, "two", "Two", "2");

    CandidateStream stream;
    stream.append(SkillScanner(bundledDir_.string(), SourceKind::official));
    stream.append(SkillScanner((testDir_ / "missing").string(), SourceKind::custom));
    stream.append(SkillScanner(userDir_.string(), SourceKind::custom));

    auto first = stream.next();
    auto second = stream.next();
    ASSERT_TRUE(first && second);
    EXPECT_EQ(first->source, SourceKind::official);
    EXPECT_EQ(first->relative_key, "one");
    EXPECT_EQ(second->source, SourceKind::custom);
    EXPECT_EQ(second->relative_key, "two");
    EXPECT_FALSE(stream.next().has_value());
}
