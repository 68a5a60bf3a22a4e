#pragma once
#include "config.hpp"
#include "database.hpp"
#include "skills_manager.hpp"
#include <memory>

namespace skillbook {

struct Catalog {
    std::shared_ptr<Database> database;
    std::unique_ptr<SkillsManager> skills;
};

// Opens the database, migrates it and builds a SkillsManager over the
// configured roots. The manager still has to be initialize()d.
Catalog open_catalog(const CatalogConfig& config);

} // namespace skillbook
