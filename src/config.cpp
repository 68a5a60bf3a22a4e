#include "config.hpp"
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace skillbook {

std::string CatalogConfig::resolve_user_data_path(std::initializer_list<std::string> parts) const {
    fs::path p(expand_path(data_dir));
    for (const auto& part : parts) p /= part;
    return p.string();
}

CatalogConfig CatalogConfig::make_default() {
    return CatalogConfig{};
}

nlohmann::json CatalogConfig::to_json() const {
    nlohmann::json j;
    j["data_dir"] = data_dir;
    j["database_path"] = database_path;
    j["skills"] = {
        {"bundled_path", bundled_skills_path},
        {"user_path", user_skills_path},
    };
    return j;
}

CatalogConfig CatalogConfig::from_json(const nlohmann::json& j) {
    CatalogConfig c;
    if (!j.is_object()) return c;

    c.data_dir = j.value("data_dir", c.data_dir);
    c.database_path = j.value("database_path", c.database_path);

    if (j.contains("skills") && j["skills"].is_object()) {
        auto& sk = j["skills"];
        c.bundled_skills_path = sk.value("bundled_path", c.bundled_skills_path);
        c.user_skills_path = sk.value("user_path", c.user_skills_path);
    }
    return c;
}

CatalogConfig CatalogConfig::load(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        std::cerr << "[config] No config at " << path << ", using defaults\n";
        return make_default();
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(f);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid config " + path + ": " + e.what());
    }
    return from_json(j);
}

void CatalogConfig::save(const std::string& path) const {
    auto parent = fs::path(path).parent_path();
    if (!parent.empty()) fs::create_directories(parent);

    std::ofstream f(path);
    if (!f) throw std::runtime_error("Cannot write config: " + path);
    f << to_json().dump(2) << "\n";
    if (!f) throw std::runtime_error("Failed writing config: " + path);
}

} // namespace skillbook
