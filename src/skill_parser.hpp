#pragma once
#include "skill.hpp"
#include <string>
#include <map>

namespace skillbook {

// File every skill directory is expected to contain.
inline constexpr const char* kSkillFileName = "SKILL.md";

// Parse one SKILL.md: a `---` delimited front-matter header followed by a
// free-form markdown body.
//
// Throws MalformedDefinition when the file cannot be read, is empty, or its
// header is not well-formed.
SkillDefinition parse_skill_file(const std::string& path);

// Same as parse_skill_file but on already loaded text. `path` is used for the
// directory-name fallback and for error messages only.
SkillDefinition parse_skill_text(const std::string& content, const std::string& path);

// Header key/value pairs. Multi-line `{ ... }` values are joined with '\n'.
// Indented and `- item` lines belong to the key above them: list items and
// `|` blocks join with '\n', `>` blocks and plain continuations with ' '.
std::map<std::string, std::string> parse_frontmatter(const std::string& header,
                                                     const std::string& path);

} // namespace skillbook
