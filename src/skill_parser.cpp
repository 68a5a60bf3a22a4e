#include "skill_parser.hpp"
#include "utils.hpp"
#include <cctype>
#include <sstream>
#include <vector>

namespace skillbook {

namespace {

std::vector<std::string> split_lines(const std::string& content) {
    std::vector<std::string> lines;
    std::istringstream stream(content);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(std::move(line));
    }
    return lines;
}

bool is_fence(const std::string& line) {
    return trim(line) == "---";
}

std::string unquote(std::string value) {
    if (value.size() >= 2) {
        char q = value.front();
        if ((q == '"' || q == '\'') && value.back() == q) {
            value = value.substr(1, value.size() - 2);
        }
    }
    return value;
}

int brace_balance(const std::string& s) {
    int depth = 0;
    for (char c : s) {
        if (c == '{') depth++;
        else if (c == '}') depth--;
    }
    return depth;
}

// How continuation lines join onto the value of the key above them
enum class BlockStyle { plain, folded, literal };

// `>` and `|` block scalars, with optional chomping/indent indicators
bool is_block_indicator(const std::string& value) {
    if (value.empty() || (value[0] != '>' && value[0] != '|')) return false;
    for (size_t i = 1; i < value.size(); i++) {
        char c = value[i];
        if (c != '+' && c != '-' && !std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

bool parse_bool(const std::string& s) {
    auto v = to_lower(trim(s));
    return v == "true" || v == "yes" || v == "1";
}

} // namespace

std::map<std::string, std::string> parse_frontmatter(const std::string& header,
                                                     const std::string& path) {
    std::map<std::string, std::string> result;
    std::string current_key;
    std::string current_value;
    int brace_depth = 0;
    int line_no = 0;

    // Key that indented, list or block-scalar lines attach to
    std::string open_key;
    BlockStyle style = BlockStyle::plain;

    for (const auto& raw : split_lines(header)) {
        line_no++;
        std::string line = trim(raw);

        if (brace_depth > 0) {
            current_value += "\n" + line;
            brace_depth += brace_balance(line);
            if (brace_depth <= 0) {
                result[current_key] = current_value;
                current_key.clear();
                current_value.clear();
                brace_depth = 0;
            }
            continue;
        }

        if (line.empty()) continue;

        bool indented = raw[0] == ' ' || raw[0] == '\t';
        bool list_item = line == "-" || line.compare(0, 2, "- ") == 0;
        if (indented || list_item) {
            if (open_key.empty()) continue;
            std::string piece = list_item ? unquote(trim(line.substr(1))) : line;
            std::string& value = result[open_key];
            if (!value.empty() && !piece.empty()) {
                value += (style == BlockStyle::folded || style == BlockStyle::plain) ? " " : "\n";
            }
            value += piece;
            continue;
        }

        if (line[0] == '#') continue;

        auto colon = line.find(':');
        if (colon == std::string::npos) {
            throw MalformedDefinition(path, "expected 'key: value' on header line " +
                                                std::to_string(line_no));
        }

        std::string key = trim(line.substr(0, colon));
        std::string value = trim(line.substr(colon + 1));
        if (key.empty()) {
            throw MalformedDefinition(path, "empty key on header line " + std::to_string(line_no));
        }

        if (!value.empty() && value[0] == '{') {
            int depth = brace_balance(value);
            if (depth > 0) {
                current_key = key;
                current_value = value;
                brace_depth = depth;
                open_key.clear();
                continue;
            }
        }

        open_key = key;
        if (is_block_indicator(value)) {
            style = value[0] == '>' ? BlockStyle::folded : BlockStyle::literal;
            result[key] = "";
        } else if (value.empty()) {
            // Block list or nested mapping follows
            style = BlockStyle::literal;
            result[key] = "";
        } else {
            style = BlockStyle::plain;
            result[key] = unquote(value);
        }
    }

    if (brace_depth > 0) {
        throw MalformedDefinition(path, "unterminated '{' value for key '" + current_key + "'");
    }
    return result;
}

SkillDefinition parse_skill_text(const std::string& content, const std::string& path) {
    std::string text = content;
    // UTF-8 BOM
    if (text.size() >= 3 && text.compare(0, 3, "\xEF\xBB\xBF") == 0) text.erase(0, 3);

    if (trim(text).empty()) {
        throw MalformedDefinition(path, "file is empty");
    }

    auto lines = split_lines(text);
    size_t first = 0;
    while (first < lines.size() && trim(lines[first]).empty()) first++;
    if (first >= lines.size() || !is_fence(lines[first])) {
        throw MalformedDefinition(path, "missing '---' front matter header");
    }

    size_t close = first + 1;
    while (close < lines.size() && !is_fence(lines[close])) close++;
    if (close >= lines.size()) {
        throw MalformedDefinition(path, "front matter header is not terminated by '---'");
    }

    std::string header;
    for (size_t i = first + 1; i < close; i++) {
        header += lines[i];
        header += '\n';
    }
    auto meta = parse_frontmatter(header, path);

    SkillDefinition def;
    auto it = meta.find("name");
    if (it != meta.end() && !trim(it->second).empty()) {
        def.name = trim(it->second);
    } else {
        def.name = fs::path(path).parent_path().filename().string();
    }
    if (def.name.empty()) {
        throw MalformedDefinition(path, "skill has no name");
    }

    it = meta.find("description");
    if (it != meta.end()) def.description = it->second;

    it = meta.find("command");
    if (it != meta.end() && !trim(it->second).empty()) def.command = trim(it->second);

    it = meta.find("verified");
    if (it != meta.end()) def.verified = parse_bool(it->second);

    size_t body_start = close + 1;
    while (body_start < lines.size() && trim(lines[body_start]).empty()) body_start++;
    for (size_t i = body_start; i < lines.size(); i++) {
        def.body_text += lines[i];
        def.body_text += '\n';
    }

    return def;
}

SkillDefinition parse_skill_file(const std::string& path) {
    std::string content;
    if (!read_file(path, content)) {
        throw MalformedDefinition(path, "cannot read file");
    }
    return parse_skill_text(content, path);
}

} // namespace skillbook
