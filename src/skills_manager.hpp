#pragma once
#include "skill.hpp"
#include "database.hpp"
#include "catalog_repository.hpp"
#include "reconciler.hpp"
#include "serial_queue.hpp"
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <atomic>
#include <future>
#include <optional>

namespace skillbook {

struct SkillsManagerOptions {
    std::string bundled_skills_path;   // official skills, never written
    std::string user_skills_path;      // custom skills, created on demand
    std::shared_ptr<Database> database;
};

// Public face of the skill catalog. Keeps an in-memory index of the catalog
// and runs every mutation on its own serial queue, so syncs and single-record
// changes never interleave. Readers get snapshots and never touch disk.
class SkillsManager {
public:
    explicit SkillsManager(SkillsManagerOptions options);
    ~SkillsManager();

    SkillsManager(const SkillsManager&) = delete;
    SkillsManager& operator=(const SkillsManager&) = delete;

    // Full sync pass. The future throws PersistenceFailure if the store
    // rejected the batch; the index then keeps its previous contents.
    std::future<SyncReport> initialize();
    std::future<SyncReport> resync();

    std::future<SkillStatus> set_skill_enabled(int64_t id, bool enabled);

    // Copy a SKILL.md (or a directory holding one) into the user root and
    // register it. The future throws MalformedDefinition if it does not parse.
    std::future<SkillRecord> add_skill(const std::string& file_path);

    // Official skills are refused with SkillStatus::forbidden.
    std::future<SkillStatus> delete_skill(int64_t id);

    std::vector<SkillRecord> get_all_skills() const;
    std::vector<SkillRecord> get_enabled_skills() const;
    std::optional<SkillRecord> get_skill_by_id(int64_t id) const;

    // Full text of the skill's SKILL.md as it is on disk now
    std::optional<std::string> get_skill_content(int64_t id) const;

    // <skills> block listing enabled skills for the assistant's system prompt
    std::string build_skills_summary() const;

    // True once a sync pass has succeeded and no later pass has failed
    bool is_ready() const { return ready_; }

    const std::string& bundled_root() const { return options_.bundled_skills_path; }
    const std::string& user_root() const { return options_.user_skills_path; }

private:
    SkillsManagerOptions options_;
    CatalogRepository repository_;
    Reconciler reconciler_;

    mutable std::mutex index_mutex_;
    std::map<int64_t, SkillRecord> index_;
    std::atomic<bool> ready_{false};

    // Declared last: destroyed first, draining queued work while the rest is alive
    SerialQueue queue_;

    SyncReport sync_now();
    SkillStatus set_enabled_now(int64_t id, bool enabled);
    SkillRecord add_now(const std::string& file_path);
    SkillStatus delete_now(int64_t id);

    std::string allocate_skill_dir(const std::string& name) const;
    void remove_backing_files(const SkillRecord& record) const;
};

} // namespace skillbook
