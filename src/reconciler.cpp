#include "reconciler.hpp"
#include "skill_parser.hpp"
#include <iostream>
#include <map>
#include <set>
#include <utility>

namespace skillbook {

namespace {

using IdentityKey = std::pair<SourceKind, std::string>;

struct ParsedCandidate {
    SkillCandidate candidate;
    SkillDefinition definition;
};

} // namespace

SkillRecord merge_skill(const SkillRecord* existing, const SkillCandidate& candidate,
                        const SkillDefinition& definition) {
    SkillRecord next;
    if (existing) {
        next.id = existing->id;
        next.source = existing->source;
        next.identity_key = existing->identity_key;
        next.is_enabled = existing->is_enabled;
        next.created_at = existing->created_at;
        next.updated_at = existing->updated_at;
    } else {
        next.source = candidate.source;
        next.identity_key = candidate.relative_key;
        next.is_enabled = true;
    }

    next.name = definition.name;
    next.description = definition.description;
    next.command = definition.command;
    next.verified = definition.verified;
    next.body_text = definition.body_text;
    next.file_path = candidate.path;
    return next;
}

bool content_differs(const SkillRecord& a, const SkillRecord& b) {
    return a.name != b.name
        || a.description != b.description
        || a.command != b.command
        || a.verified != b.verified
        || a.body_text != b.body_text
        || a.file_path != b.file_path;
}

Reconciler::Reconciler(std::string bundled_root, std::string custom_root,
                       CatalogRepository& repository)
    : bundled_root_(std::move(bundled_root))
    , custom_root_(std::move(custom_root))
    , repository_(repository) {}

SyncReport Reconciler::run() {
    CandidateStream stream;
    stream.append(SkillScanner(bundled_root_, SourceKind::official));
    stream.append(SkillScanner(custom_root_, SourceKind::custom));
    return run(stream);
}

SyncReport Reconciler::run(CandidateStream& stream) {
    SyncReport report;

    // Discover and parse; a bad file only costs its own entry
    std::map<IdentityKey, ParsedCandidate> discovered;
    std::vector<IdentityKey> scan_order;
    std::set<IdentityKey> on_disk;
    while (auto c = stream.next()) {
        on_disk.insert({c->source, c->relative_key});

        SkillDefinition def;
        try {
            def = parse_skill_file(c->path);
        } catch (const MalformedDefinition& e) {
            report.skipped_malformed++;
            std::cerr << "[sync] Skipping " << e.what() << "\n";
            continue;
        }

        IdentityKey key{c->source, c->relative_key};
        if (discovered.count(key)) {
            report.skipped_conflicts++;
            std::cerr << "[sync] Skipping " << c->path << ": "
                      << source_kind_name(c->source) << " skill '" << c->relative_key
                      << "' already discovered at " << discovered.at(key).candidate.path << "\n";
            continue;
        }
        scan_order.push_back(key);
        discovered.emplace(std::move(key), ParsedCandidate{std::move(*c), std::move(def)});
    }

    // Diff against the store
    auto persisted = repository_.list_all();
    std::map<IdentityKey, const SkillRecord*> by_key;
    for (const auto& r : persisted) {
        by_key[{r.source, r.identity_key}] = &r;
    }

    std::vector<SkillRecord> inserts;
    std::vector<SkillRecord> updates;
    std::vector<int64_t> deletes;

    for (const auto& key : scan_order) {
        const auto& pc = discovered.at(key);
        auto found = by_key.find(key);
        if (found == by_key.end()) {
            inserts.push_back(merge_skill(nullptr, pc.candidate, pc.definition));
            continue;
        }
        SkillRecord merged = merge_skill(found->second, pc.candidate, pc.definition);
        if (content_differs(merged, *found->second)) {
            updates.push_back(std::move(merged));
        } else {
            report.unchanged++;
        }
    }

    // Stale rows go regardless of source. A row whose file is still there but
    // failed to parse is left as it is until the file parses again.
    for (const auto& [key, record] : by_key) {
        if (!on_disk.count(key)) deletes.push_back(record->id);
    }

    repository_.apply_batch(inserts, updates, deletes);

    report.inserted = static_cast<int>(inserts.size());
    report.updated = static_cast<int>(updates.size());
    report.deleted = static_cast<int>(deletes.size());
    report.records = repository_.list_all();

    std::cerr << "[sync] " << report.records.size() << " skill(s): +" << report.inserted
              << " ~" << report.updated << " -" << report.deleted << " ="
              << report.unchanged;
    if (report.skipped_malformed > 0) std::cerr << ", " << report.skipped_malformed << " malformed";
    if (report.skipped_conflicts > 0) std::cerr << ", " << report.skipped_conflicts << " conflicting";
    std::cerr << "\n";
    return report;
}

} // namespace skillbook
