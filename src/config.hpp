#pragma once
#include <string>
#include <initializer_list>
#include <nlohmann/json.hpp>
#include "utils.hpp"

namespace skillbook {

struct CatalogConfig {
    std::string bundled_skills_path;                     // empty = no official skills
    std::string user_skills_path = "~/.skillbook/skills";
    std::string database_path = "~/.skillbook/skillbook.db";
    std::string data_dir = "~/.skillbook";

    // Derived helpers
    std::string bundled_path() const { return expand_path(bundled_skills_path); }
    std::string user_path() const { return expand_path(user_skills_path); }
    std::string db_path() const { return expand_path(database_path); }

    // data_dir joined with each part in turn
    std::string resolve_user_data_path(std::initializer_list<std::string> parts) const;

    static CatalogConfig make_default();
    // Missing file yields defaults; a file that is not valid JSON throws
    static CatalogConfig load(const std::string& path);
    void save(const std::string& path) const;
    nlohmann::json to_json() const;
    static CatalogConfig from_json(const nlohmann::json& j);
};

} // namespace skillbook
