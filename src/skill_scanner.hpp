#pragma once
#include "skill.hpp"
#include "utils.hpp"
#include <string>
#include <optional>
#include <vector>

namespace skillbook {

struct SkillCandidate {
    std::string path;           // absolute path to SKILL.md
    SourceKind source;
    std::string relative_key;   // name of the skill's subdirectory
};

// Lazily walks the immediate subdirectories of one root and yields the
// SKILL.md files found there. A missing root yields nothing.
class SkillScanner {
public:
    SkillScanner(std::string root, SourceKind source);

    SkillScanner(const SkillScanner&) = delete;
    SkillScanner& operator=(const SkillScanner&) = delete;
    SkillScanner(SkillScanner&&) = default;
    SkillScanner& operator=(SkillScanner&&) = default;

    // Next candidate, or nullopt once the root is exhausted
    std::optional<SkillCandidate> next();

    const std::string& root() const { return root_; }
    SourceKind source() const { return source_; }

    // Drain a scanner into a vector
    static std::vector<SkillCandidate> collect(const std::string& root, SourceKind source);

private:
    std::string root_;
    SourceKind source_;
    bool opened_ = false;
    fs::directory_iterator it_;

    void open();
};

// Concatenation of several scanners, consumed in order.
class CandidateStream {
public:
    void append(SkillScanner scanner) { scanners_.push_back(std::move(scanner)); }
    std::optional<SkillCandidate> next();

private:
    std::vector<SkillScanner> scanners_;
    size_t current_ = 0;
};

} // namespace skillbook
