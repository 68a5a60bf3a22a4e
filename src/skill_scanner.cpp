#include "skill_scanner.hpp"
#include "skill_parser.hpp"
#include <iostream>

namespace skillbook {

SkillScanner::SkillScanner(std::string root, SourceKind source)
    : root_(std::move(root)), source_(source) {}

void SkillScanner::open() {
    opened_ = true;
    std::error_code ec;
    if (!fs::is_directory(root_, ec)) return;   // nothing installed there yet

    it_ = fs::directory_iterator(root_, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        std::cerr << "[scanner] Cannot list " << root_ << ": " << ec.message() << "\n";
        it_ = fs::directory_iterator();
    }
}

std::optional<SkillCandidate> SkillScanner::next() {
    if (!opened_) open();

    std::error_code ec;
    for (; it_ != fs::directory_iterator(); it_.increment(ec)) {
        if (ec) {
            std::cerr << "[scanner] Listing " << root_ << " stopped: " << ec.message() << "\n";
            it_ = fs::directory_iterator();
            break;
        }

        const auto& entry = *it_;
        if (!entry.is_directory(ec)) continue;

        std::string dir_name = entry.path().filename().string();
        if (dir_name.empty() || dir_name[0] == '.') continue;

        fs::path skill_md = entry.path() / kSkillFileName;
        if (!fs::is_regular_file(skill_md, ec)) continue;

        SkillCandidate c;
        c.path = fs::absolute(skill_md, ec).string();
        if (ec) c.path = skill_md.string();
        c.source = source_;
        c.relative_key = std::move(dir_name);

        it_.increment(ec);
        if (ec) {
            std::cerr << "[scanner] Listing " << root_ << " stopped: " << ec.message() << "\n";
            it_ = fs::directory_iterator();
        }
        return c;
    }
    return std::nullopt;
}

std::vector<SkillCandidate> SkillScanner::collect(const std::string& root, SourceKind source) {
    SkillScanner scanner(root, source);
    std::vector<SkillCandidate> out;
    while (auto c = scanner.next()) out.push_back(std::move(*c));
    return out;
}

std::optional<SkillCandidate> CandidateStream::next() {
    while (current_ < scanners_.size()) {
        if (auto c = scanners_[current_].next()) return c;
        current_++;
    }
    return std::nullopt;
}

} // namespace skillbook
