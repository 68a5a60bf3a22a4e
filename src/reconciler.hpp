#pragma once
#include "skill.hpp"
#include "skill_scanner.hpp"
#include "catalog_repository.hpp"
#include <string>
#include <vector>

namespace skillbook {

struct SyncReport {
    std::vector<SkillRecord> records;   // catalog after the pass, ordered by id
    int inserted = 0;
    int updated = 0;
    int unchanged = 0;
    int deleted = 0;
    int skipped_malformed = 0;
    int skipped_conflicts = 0;
};

// Builds the next version of a catalog row from a freshly parsed definition.
// `existing` is null for a skill seen for the first time. id, source,
// identity_key, is_enabled and created_at always come from `existing`;
// everything else comes from the file.
SkillRecord merge_skill(const SkillRecord* existing, const SkillCandidate& candidate,
                        const SkillDefinition& definition);

// True if the fields a sync may overwrite differ between the two records
bool content_differs(const SkillRecord& a, const SkillRecord& b);

// One discover -> parse -> diff -> apply pass over the bundled and user roots.
class Reconciler {
public:
    Reconciler(std::string bundled_root, std::string custom_root, CatalogRepository& repository);

    // Throws PersistenceFailure if the batch could not be applied; the store
    // is left as it was before the call.
    SyncReport run();

    // Same pass over an already assembled candidate stream
    SyncReport run(CandidateStream& stream);

private:
    std::string bundled_root_;
    std::string custom_root_;
    CatalogRepository& repository_;
};

} // namespace skillbook
