#include "text.hpp"
#include <cctype>

namespace stmt::text {

bool is_word_char(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return std::isalnum(u) || c == '_';
}

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

std::string to_upper(std::string_view s) {
    std::string out(s);
    for (auto& c : out) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return out;
}

namespace {

// Length of a UTF-8 NBSP (C2 A0) at position i, or 0
size_t nbsp_at(std::string_view s, size_t i) {
    if (i + 1 < s.size() && static_cast<unsigned char>(s[i]) == 0xC2 &&
        static_cast<unsigned char>(s[i + 1]) == 0xA0) {
        return 2;
    }
    return 0;
}

size_t nbsp_before(std::string_view s, size_t end) {
    if (end >= 2 && static_cast<unsigned char>(s[end - 2]) == 0xC2 &&
        static_cast<unsigned char>(s[end - 1]) == 0xA0) {
        return 2;
    }
    return 0;
}

} // namespace

std::string trim(std::string_view s) {
    size_t start = 0;
    size_t end = s.size();
    while (start < end) {
        if (is_space(s[start])) { ++start; continue; }
        size_t n = nbsp_at(s, start);
        if (n == 0) break;
        start += n;
    }
    while (end > start) {
        if (is_space(s[end - 1])) { --end; continue; }
        size_t n = nbsp_before(s, end);
        if (n == 0) break;
        end -= n;
    }
    return std::string(s.substr(start, end - start));
}

std::string collapse_whitespace(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    bool pending_space = false;
    for (char c : s) {
        if (is_space(c)) {
            pending_space = true;
            continue;
        }
        if (pending_space && !out.empty()) out += ' ';
        pending_space = false;
        out += c;
    }
    return out;
}

std::string title_case(std::string_view s) {
    std::string lower = to_lower(s);
    std::string out;
    out.reserve(lower.size());
    for (const auto& part : split_any(lower, " ")) {
        if (part.empty()) continue;
        if (!out.empty()) out += ' ';
        out += static_cast<char>(std::toupper(static_cast<unsigned char>(part[0])));
        out.append(part, 1, std::string::npos);
    }
    return out;
}

bool starts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool contains(std::string_view haystack, std::string_view needle) {
    return haystack.find(needle) != std::string_view::npos;
}

bool contains_word(std::string_view haystack, std::string_view word) {
    if (word.empty()) return false;
    size_t pos = haystack.find(word);
    while (pos != std::string_view::npos) {
        size_t end = pos + word.size();
        bool left_ok = pos == 0 || is_word_char(haystack[pos - 1]) != is_word_char(word.front());
        bool right_ok = end == haystack.size() || is_word_char(haystack[end]) != is_word_char(word.back());
        if (left_ok && right_ok) return true;
        pos = haystack.find(word, pos + 1);
    }
    return false;
}

std::vector<std::string> split_any(std::string_view s, std::string_view delims) {
    std::vector<std::string> parts;
    std::string cur;
    for (char c : s) {
        if (delims.find(c) != std::string_view::npos) {
            parts.push_back(cur);
            cur.clear();
        } else {
            cur += c;
        }
    }
    parts.push_back(cur);
    return parts;
}

std::string alnum_key(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        unsigned char u = static_cast<unsigned char>(c);
        if (std::isalnum(u)) out += static_cast<char>(std::tolower(u));
    }
    return out;
}

} // namespace stmt::text
