#include "storyline/text.hpp"

#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace storyline {

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' ||
           c == '\v';
}

std::string trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && is_space(s[b]))
        ++b;
    while (e > b && is_space(s[e - 1]))
        --e;
    return std::string(s.substr(b, e - b));
}

std::string trim_end(std::string_view s) {
    size_t e = s.size();
    while (e > 0 && is_space(s[e - 1]))
        --e;
    return std::string(s.substr(0, e));
}

std::string replace_all(std::string_view s, std::string_view from,
                        std::string_view to) {
    if (from.empty())
        return std::string(s);
    std::string out;
    out.reserve(s.size());
    size_t pos = 0;
    while (pos < s.size()) {
        size_t hit = s.find(from, pos);
        if (hit == std::string_view::npos) {
            out.append(s.substr(pos));
            break;
        }
        out.append(s.substr(pos, hit - pos));
        out.append(to);
        pos = hit + from.size();
    }
    return out;
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    for (auto &c : out) {
        auto u = static_cast<unsigned char>(c);
        if (u < 0x80)
            c = static_cast<char>(std::tolower(u));
    }
    return out;
}

bool contains(std::string_view s, std::string_view needle) {
    return s.find(needle) != std::string_view::npos;
}

bool has_alphanumeric(std::string_view s) {
    for (char c : s) {
        auto u = static_cast<unsigned char>(c);
        if (u >= 0x80 || std::isalnum(u))
            return true;
    }
    return false;
}

std::vector<std::string> split(std::string_view s, char sep) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t hit = s.find(sep, start);
        if (hit == std::string_view::npos) {
            parts.emplace_back(s.substr(start));
            break;
        }
        parts.emplace_back(s.substr(start, hit - start));
        start = hit + 1;
    }
    return parts;
}

std::vector<std::string> split(std::string_view s, std::string_view sep) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t hit = s.find(sep, start);
        if (hit == std::string_view::npos) {
            parts.emplace_back(s.substr(start));
            break;
        }
        parts.emplace_back(s.substr(start, hit - start));
        start = hit + sep.size();
    }
    return parts;
}

// ─── File Helpers ───────────────────────────────────────────────────────────

std::string read_file(const std::string &path) {
    std::ifstream file(path, std::ios::binary);
    if (!file)
        throw std::runtime_error("Cannot open file: " + path);
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

std::vector<std::string> read_lines(const std::string &path) {
    std::ifstream file(path);
    if (!file)
        throw std::runtime_error("Cannot open file: " + path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        lines.push_back(std::move(line));
    }
    return lines;
}

} // namespace storyline
