#include "catalog.hpp"
#include "migrations.hpp"
#include <iostream>

namespace skillbook {

Catalog open_catalog(const CatalogConfig& config) {
    Catalog catalog;
    catalog.database = std::make_shared<Database>(config.db_path());
    run_migrations(*catalog.database);

    SkillsManagerOptions options;
    options.bundled_skills_path = config.bundled_path();
    options.user_skills_path = config.user_path();
    options.database = catalog.database;
    catalog.skills = std::make_unique<SkillsManager>(std::move(options));

    std::cerr << "[catalog] Opened " << config.db_path() << " (schema v"
              << stored_schema_version(*catalog.database) << ")\n";
    return catalog;
}

} // namespace skillbook
