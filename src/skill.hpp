#pragma once
#include <string>
#include <optional>
#include <cstdint>
#include <stdexcept>

namespace skillbook {

enum class SourceKind {
    official,   // shipped with the application, read-only for the user
    custom,     // added by the user
};

inline std::string source_kind_name(SourceKind kind) {
    return kind == SourceKind::official ? "official" : "custom";
}

inline std::optional<SourceKind> parse_source_kind(const std::string& s) {
    if (s == "official") return SourceKind::official;
    if (s == "custom") return SourceKind::custom;
    return std::nullopt;
}

// One parsed SKILL.md. Has no identity of its own.
struct SkillDefinition {
    std::string name;
    std::string description;
    std::optional<std::string> command;
    bool verified = false;
    std::string body_text;
};

// One catalog row.
struct SkillRecord {
    int64_t id = 0;
    SourceKind source = SourceKind::custom;
    std::string identity_key;   // subdirectory name under the source root
    std::string name;
    std::string description;
    std::optional<std::string> command;
    bool verified = false;
    std::string body_text;
    bool is_enabled = true;
    std::string file_path;
    int64_t created_at = 0;
    int64_t updated_at = 0;
};

// Outcome of a single-record mutation that can be refused without an error.
enum class SkillStatus {
    ok,
    not_found,
    forbidden,
};

inline const char* skill_status_name(SkillStatus s) {
    switch (s) {
        case SkillStatus::ok: return "ok";
        case SkillStatus::not_found: return "not_found";
        case SkillStatus::forbidden: return "forbidden";
    }
    return "unknown";
}

// A single definition file could not be read or its header is ill-formed.
class MalformedDefinition : public std::runtime_error {
public:
    MalformedDefinition(const std::string& path, const std::string& reason)
        : std::runtime_error("Malformed skill definition " + path + ": " + reason)
        , path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// The storage engine rejected a statement or transaction.
class PersistenceFailure : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace skillbook
