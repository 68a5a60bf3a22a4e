#pragma once
#include <string>
#include <cstdlib>
#include <cstdint>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <chrono>

namespace skillbook {

namespace fs = std::filesystem;

inline std::string home_dir() {
#ifdef _WIN32
    const char* h = std::getenv("USERPROFILE");
    if (!h) h = std::getenv("HOMEDRIVE");
#else
    const char* h = std::getenv("HOME");
#endif
    return h ? std::string(h) : ".";
}

inline std::string expand_path(const std::string& p) {
    if (p == "~") return home_dir();
    if (p.size() >= 2 && p[0] == '~' && (p[1] == '/' || p[1] == '\\')) {
        return home_dir() + p.substr(1);
    }
    return p;
}

// Returns false when the file cannot be opened; `out` is left untouched then.
inline bool read_file(const std::string& path, std::string& out) {
    std::ifstream f(path, std::ios::binary);
    if (!f) return false;
    std::ostringstream ss;
    ss << f.rdbuf();
    if (f.bad()) return false;
    out = ss.str();
    return true;
}

inline int64_t epoch_now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

inline std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

inline std::string to_lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

// Directory-safe slug: lowercase alphanumerics, runs of anything else collapse to '-'
inline std::string sanitize_name(const std::string& name) {
    std::string out;
    bool prev = false;
    for (char c : name) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            prev = false;
        } else if (!prev) {
            out += '-';
            prev = true;
        }
    }
    while (!out.empty() && out.front() == '-') out.erase(out.begin());
    while (!out.empty() && out.back() == '-') out.pop_back();
    return out.empty() ? "skill" : out;
}

} // namespace skillbook
