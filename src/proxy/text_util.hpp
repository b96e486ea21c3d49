#pragma once

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>

inline bool is_ascii_alpha(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

inline bool is_ascii_digit(char c) {
    return c >= '0' && c <= '9';
}

inline bool is_ascii_alnum(char c) {
    return is_ascii_alpha(c) || is_ascii_digit(c);
}

inline bool is_ascii_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

inline bool is_hex_digit(char c) {
    return is_ascii_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

inline int hex_value(char c) {
    if (is_ascii_digit(c)) {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    return c - 'A' + 10;
}

inline char ascii_lower(char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

inline std::string to_lower(std::string_view p_value) {
    std::string result(p_value);
    std::transform(result.begin(), result.end(), result.begin(), ascii_lower);
    return result;
}

inline bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(),
                      [](char x, char y) { return ascii_lower(x) == ascii_lower(y); });
}

inline bool starts_with(std::string_view p_value, std::string_view p_prefix) {
    return p_value.substr(0, p_prefix.size()) == p_prefix;
}

inline bool istarts_with(std::string_view p_value, std::string_view p_prefix) {
    return p_value.size() >= p_prefix.size() && iequals(p_value.substr(0, p_prefix.size()), p_prefix);
}

inline bool iends_with(std::string_view p_value, std::string_view p_suffix) {
    return p_value.size() >= p_suffix.size() &&
           iequals(p_value.substr(p_value.size() - p_suffix.size()), p_suffix);
}

// Case-insensitive search for an ASCII needle
inline size_t ifind(std::string_view p_haystack, std::string_view p_needle, size_t p_pos = 0) {
    if (p_needle.empty()) {
        return p_pos <= p_haystack.size() ? p_pos : std::string_view::npos;
    }
    for (size_t i = p_pos; i + p_needle.size() <= p_haystack.size(); ++i) {
        if (iequals(p_haystack.substr(i, p_needle.size()), p_needle)) {
            return i;
        }
    }
    return std::string_view::npos;
}

inline std::string_view trim(std::string_view p_value) {
    while (!p_value.empty() && is_ascii_space(p_value.front())) {
        p_value.remove_prefix(1);
    }
    while (!p_value.empty() && is_ascii_space(p_value.back())) {
        p_value.remove_suffix(1);
    }
    return p_value;
}
