#include "skills_manager.hpp"
#include "skill_parser.hpp"
#include "utils.hpp"
#include <iostream>

namespace skillbook {

namespace {

fs::path normalized(const fs::path& p) {
    std::error_code ec;
    fs::path out = fs::weakly_canonical(p, ec);
    if (ec) out = fs::absolute(p, ec).lexically_normal();
    if (out.has_parent_path() && out.filename().empty()) out = out.parent_path();
    return out;
}

} // namespace

SkillsManager::SkillsManager(SkillsManagerOptions options)
    : options_(std::move(options))
    , repository_(options_.database)
    , reconciler_(options_.bundled_skills_path, options_.user_skills_path, repository_)
{}

SkillsManager::~SkillsManager() {
    queue_.stop();
}

// ── Sync ─────────────────────────────────────────────────────────────

std::future<SyncReport> SkillsManager::initialize() {
    return queue_.submit([this]() { return sync_now(); });
}

std::future<SyncReport> SkillsManager::resync() {
    return queue_.submit([this]() { return sync_now(); });
}

SyncReport SkillsManager::sync_now() {
    SyncReport report;
    try {
        report = reconciler_.run();
    } catch (const PersistenceFailure& e) {
        ready_ = false;
        std::cerr << "[skills] Sync failed, keeping previous catalog: " << e.what() << "\n";
        throw;
    }

    std::map<int64_t, SkillRecord> next;
    for (const auto& r : report.records) next.emplace(r.id, r);
    {
        std::lock_guard<std::mutex> lock(index_mutex_);
        index_.swap(next);
    }
    ready_ = true;
    return report;
}

// ── Mutations ────────────────────────────────────────────────────────

std::future<SkillStatus> SkillsManager::set_skill_enabled(int64_t id, bool enabled) {
    return queue_.submit([this, id, enabled]() { return set_enabled_now(id, enabled); });
}

SkillStatus SkillsManager::set_enabled_now(int64_t id, bool enabled) {
    {
        std::lock_guard<std::mutex> lock(index_mutex_);
        if (!index_.count(id)) return SkillStatus::not_found;
    }

    if (!repository_.set_enabled(id, enabled)) {
        // Row vanished behind our back; drop it from the index as well
        std::lock_guard<std::mutex> lock(index_mutex_);
        index_.erase(id);
        return SkillStatus::not_found;
    }

    std::lock_guard<std::mutex> lock(index_mutex_);
    auto it = index_.find(id);
    if (it != index_.end()) it->second.is_enabled = enabled;
    std::cerr << "[skills] " << (enabled ? "Enabled" : "Disabled") << " skill " << id << "\n";
    return SkillStatus::ok;
}

std::future<SkillRecord> SkillsManager::add_skill(const std::string& file_path) {
    return queue_.submit([this, file_path]() { return add_now(file_path); });
}

std::string SkillsManager::allocate_skill_dir(const std::string& name) const {
    const fs::path root(options_.user_skills_path);
    const std::string base = sanitize_name(name);

    std::lock_guard<std::mutex> lock(index_mutex_);
    auto taken = [&](const std::string& key) {
        std::error_code ec;
        if (fs::exists(root / key, ec) || ec) return true;
        for (const auto& [id, r] : index_) {
            if (r.source == SourceKind::custom && r.identity_key == key) return true;
        }
        return false;
    };

    std::string key = base;
    for (int n = 2; taken(key); n++) {
        key = base + "-" + std::to_string(n);
    }
    return key;
}

SkillRecord SkillsManager::add_now(const std::string& file_path) {
    std::string source_file = file_path;
    std::error_code ec;
    if (fs::is_directory(source_file, ec)) {
        source_file = (fs::path(source_file) / kSkillFileName).string();
    }

    SkillDefinition def = parse_skill_file(source_file);

    fs::create_directories(options_.user_skills_path, ec);
    if (ec) {
        throw PersistenceFailure("Cannot create skills directory " + options_.user_skills_path +
                                 ": " + ec.message());
    }

    std::string key = allocate_skill_dir(def.name);
    fs::path dir = fs::path(options_.user_skills_path) / key;
    fs::path target = dir / kSkillFileName;

    fs::create_directory(dir, ec);
    if (!ec) fs::copy_file(source_file, target, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        std::error_code cleanup;
        fs::remove_all(dir, cleanup);
        throw PersistenceFailure("Cannot copy " + source_file + " to " + target.string() + ": " +
                                 ec.message());
    }

    SkillCandidate candidate;
    candidate.path = fs::absolute(target, ec).string();
    if (ec) candidate.path = target.string();
    candidate.source = SourceKind::custom;
    candidate.relative_key = key;

    SkillRecord record = merge_skill(nullptr, candidate, def);
    try {
        auto ids = repository_.apply_batch({record}, {}, {});
        record.id = ids.at(0);
        if (auto stored = repository_.find(record.id)) record = *stored;
    } catch (const PersistenceFailure&) {
        std::error_code cleanup;
        fs::remove_all(dir, cleanup);
        throw;
    }

    {
        std::lock_guard<std::mutex> lock(index_mutex_);
        index_[record.id] = record;
    }
    std::cerr << "[skills] Added custom skill '" << record.name << "' (" << record.id << ") at "
              << record.file_path << "\n";
    return record;
}

std::future<SkillStatus> SkillsManager::delete_skill(int64_t id) {
    return queue_.submit([this, id]() { return delete_now(id); });
}

void SkillsManager::remove_backing_files(const SkillRecord& record) const {
    fs::path file(record.file_path);
    fs::path dir = file.parent_path();
    std::error_code ec;

    // Only a skill living in its own directory under the user root loses the whole directory
    bool own_dir = !dir.empty()
        && dir.filename().string() == record.identity_key
        && normalized(dir).parent_path() == normalized(options_.user_skills_path);

    if (own_dir) {
        fs::remove_all(dir, ec);
    } else {
        fs::remove(file, ec);
    }
    if (ec) {
        throw PersistenceFailure("Cannot remove skill files at " +
                                 (own_dir ? dir.string() : file.string()) + ": " + ec.message());
    }
}

SkillStatus SkillsManager::delete_now(int64_t id) {
    SkillRecord record;
    {
        std::lock_guard<std::mutex> lock(index_mutex_);
        auto it = index_.find(id);
        if (it == index_.end()) return SkillStatus::not_found;
        record = it->second;
    }

    if (record.source == SourceKind::official) {
        std::cerr << "[skills] Refusing to delete official skill '" << record.name << "'\n";
        return SkillStatus::forbidden;
    }

    // Files first: if the row delete then fails, the next sync drops the row anyway
    remove_backing_files(record);
    repository_.apply_batch({}, {}, {id});

    {
        std::lock_guard<std::mutex> lock(index_mutex_);
        index_.erase(id);
    }
    std::cerr << "[skills] Deleted custom skill '" << record.name << "' (" << id << ")\n";
    return SkillStatus::ok;
}

// ── Queries ──────────────────────────────────────────────────────────

std::vector<SkillRecord> SkillsManager::get_all_skills() const {
    std::lock_guard<std::mutex> lock(index_mutex_);
    std::vector<SkillRecord> out;
    out.reserve(index_.size());
    for (const auto& [id, r] : index_) out.push_back(r);
    return out;
}

std::vector<SkillRecord> SkillsManager::get_enabled_skills() const {
    std::lock_guard<std::mutex> lock(index_mutex_);
    std::vector<SkillRecord> out;
    for (const auto& [id, r] : index_) {
        if (r.is_enabled) out.push_back(r);
    }
    return out;
}

std::optional<SkillRecord> SkillsManager::get_skill_by_id(int64_t id) const {
    std::lock_guard<std::mutex> lock(index_mutex_);
    auto it = index_.find(id);
    if (it == index_.end()) return std::nullopt;
    return it->second;
}

std::optional<std::string> SkillsManager::get_skill_content(int64_t id) const {
    auto record = get_skill_by_id(id);
    if (!record) return std::nullopt;
    std::string content;
    if (!read_file(record->file_path, content)) return std::nullopt;
    return content;
}

std::string SkillsManager::build_skills_summary() const {
    auto skills = get_enabled_skills();
    if (skills.empty()) return "";

    std::string out = "--- Available Skills ---\n";
    out += "Skills extend your capabilities. Use `read_file` to load a skill's full instructions when needed.\n\n";
    out += "<skills>\n";

    for (const auto& s : skills) {
        out += "  <skill source=\"" + source_kind_name(s.source) + "\"" +
               (s.verified ? " verified=\"true\"" : "") + ">\n";
        out += "    <name>" + s.name + "</name>\n";
        if (!s.description.empty()) {
            out += "    <description>" + s.description + "</description>\n";
        }
        if (s.command) {
            out += "    <command>" + *s.command + "</command>\n";
        }
        out += "    <location>" + s.file_path + "</location>\n";
        out += "  </skill>\n";
    }

    out += "</skills>\n";
    return out;
}

} // namespace skillbook
