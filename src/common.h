// common.h - Shared utilities for rule_audit
// Line classification, pattern matchers, UTF-8 helpers

#ifndef RULEAUDIT_COMMON_H
#define RULEAUDIT_COMMON_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace ruleaudit {

//=============================================================================
// Character Classes
//=============================================================================

inline bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// Number of leading whitespace bytes
inline size_t indentation_of(std::string_view line) {
    size_t i = 0;
    while (i < line.size() && is_space(line[i])) ++i;
    return i;
}

inline bool has_eol(std::string_view line) {
    return !line.empty() && line.back() == '\n';
}

//=============================================================================
// Line Predicates
//=============================================================================

// Empty once NBSP (U+00A0) is treated as a space
inline bool line_is_blank(std::string_view line) {
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (is_space(c)) continue;
        if (static_cast<unsigned char>(c) == 0xC2 && i + 1 < line.size() &&
            static_cast<unsigned char>(line[i + 1]) == 0xA0) {
            ++i;
            continue;
        }
        return false;
    }
    return true;
}

inline bool line_is_start_of_document(std::string_view line) {
    return line.substr(0, 3) == "---";
}

// "# [AUDIT]" comments are inserted by a rewrite and discarded by the next one
inline bool line_is_audit_comment(std::string_view line) {
    size_t i = indentation_of(line);
    if (i >= line.size() || line[i] != '#') return false;
    ++i;
    while (i < line.size() && is_space(line[i])) ++i;
    return line.substr(i, 7) == "[AUDIT]";
}

inline bool line_is_normal_comment(std::string_view line) {
    size_t i = indentation_of(line);
    return i < line.size() && line[i] == '#' && !line_is_audit_comment(line);
}

// Blank and comment lines never end a record block
inline bool line_is_content(std::string_view line) {
    return !line_is_blank(line) && !line_is_normal_comment(line);
}

// Left-stripped line begins with a sequence item marker "- "
inline bool line_is_sequence_item(std::string_view line) {
    size_t i = indentation_of(line);
    return line.substr(i, 2) == "- ";
}

//=============================================================================
// Field Matchers (return true on match)
//=============================================================================

// ^\s*-*\s*<field>:\s*\S+
inline bool match_item_field_line(std::string_view line, std::string_view field) {
    size_t i = indentation_of(line);
    while (i < line.size() && line[i] == '-') ++i;
    while (i < line.size() && is_space(line[i])) ++i;
    if (line.substr(i, field.size()) != field) return false;
    i += field.size();
    if (i >= line.size() || line[i] != ':') return false;
    ++i;
    while (i < line.size() && is_space(line[i])) ++i;
    return i < line.size();
}

// ^\s*<field>:\s*\S+
inline bool match_field_line(std::string_view line, std::string_view field) {
    size_t i = indentation_of(line);
    if (line.substr(i, field.size()) != field) return false;
    i += field.size();
    if (i >= line.size() || line[i] != ':') return false;
    ++i;
    while (i < line.size() && is_space(line[i])) ++i;
    return i < line.size();
}

// Quoted single-key item: - "key": ...  or  - 'key': ...
// `quoted` receives the key token with its quotes and escapes intact.
// Double quotes allow an empty key, single quotes need at least one char
inline bool match_single_key_line(std::string_view line, std::string& quoted) {
    size_t i = indentation_of(line);
    if (i >= line.size() || line[i] != '-') return false;
    ++i;
    size_t ws = i;
    while (i < line.size() && is_space(line[i])) ++i;
    if (i >= line.size()) return false;

    char quote = line[i];
    if (quote == '"') {
        size_t end = i + 1;
        while (end < line.size() && line[end] != '"') {
            end += (line[end] == '\\') ? 2 : 1;
        }
        if (end >= line.size()) return false;
        size_t j = end + 1;
        while (j < line.size() && is_space(line[j])) ++j;
        if (j >= line.size() || line[j] != ':') return false;
        quoted.assign(line.substr(i, end - i + 1));
        return true;
    }
    if (quote == '\'' && i > ws) {
        // Shortest key whose closing quote is followed by optional spaces and ':'
        for (size_t end = line.find('\'', i + 2); end != std::string_view::npos;
             end = line.find('\'', end + 1)) {
            size_t j = end + 1;
            while (j < line.size() && is_space(line[j])) ++j;
            if (j < line.size() && line[j] == ':') {
                quoted.assign(line.substr(i, end - i + 1));
                return true;
            }
        }
    }
    return false;
}

//=============================================================================
// String Helpers
//=============================================================================

inline std::string to_lower_ascii(std::string s) {
    for (char& c : s) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    return s;
}

// Decode the first UTF-8 code point, return bytes consumed (0 = invalid)
inline size_t utf8_decode(std::string_view s, uint32_t& cp) {
    if (s.empty()) return 0;
    unsigned char c0 = static_cast<unsigned char>(s[0]);
    size_t len;
    if (c0 < 0x80) { cp = c0; return 1; }
    else if ((c0 & 0xE0) == 0xC0) { cp = c0 & 0x1F; len = 2; }
    else if ((c0 & 0xF0) == 0xE0) { cp = c0 & 0x0F; len = 3; }
    else if ((c0 & 0xF8) == 0xF0) { cp = c0 & 0x07; len = 4; }
    else return 0;
    if (s.size() < len) return 0;
    for (size_t i = 1; i < len; ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if ((c & 0xC0) != 0x80) return 0;
        cp = (cp << 6) | (c & 0x3F);
    }
    return len;
}

// True when s holds exactly one code point
inline bool is_single_code_point(std::string_view s, uint32_t& cp) {
    size_t n = utf8_decode(s, cp);
    return n > 0 && n == s.size();
}

} // namespace ruleaudit

#endif // RULEAUDIT_COMMON_H
