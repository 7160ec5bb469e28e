// StringUtils.cpp
#include "StringUtils.hpp"
#include <cctype>   // Required for isspace, isalpha, isdigit, tolower
#include <algorithm>// Required for std::find_if

namespace {
    // A helper function to check if a character is NOT a whitespace.
    // We'll use this with the strip function.
    bool is_not_space(char c) {
        return !std::isspace(static_cast<unsigned char>(c));
    }
}

bool StringUtils::isspace(char c) {
    // The cast is important for handling different character sets correctly.
    return std::isspace(static_cast<unsigned char>(c));
}

bool StringUtils::isletter(char c) {
    return std::isalpha(static_cast<unsigned char>(c));
}

bool StringUtils::isdigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c));
}

bool StringUtils::is_ident_start(char c) {
    return c == '_' || isletter(c);
}

bool StringUtils::is_ident_char(char c) {
    return c == '_' || std::isalnum(static_cast<unsigned char>(c));
}

bool StringUtils::contains(const std::string& str, char c) {
    // string::find returns string::npos if the character isn't found.
    return str.find(c) != std::string::npos;
}

void StringUtils::strip(std::string& str) {
    // Erase leading whitespace
    str.erase(str.begin(), std::find_if(str.begin(), str.end(), is_not_space));

    // Erase trailing whitespace
    str.erase(std::find_if(str.rbegin(), str.rend(), is_not_space).base(), str.end());
}

std::string_view StringUtils::lstrip_view(std::string_view s) {
    size_t i = 0;
    while (i < s.size() && isspace(s[i])) {
        i++;
    }
    return s.substr(i);
}

std::string_view StringUtils::rstrip_view(std::string_view s) {
    size_t n = s.size();
    while (n > 0 && isspace(s[n - 1])) {
        n--;
    }
    return s.substr(0, n);
}

std::string_view StringUtils::strip_view(std::string_view s) {
    return rstrip_view(lstrip_view(s));
}

std::string_view StringUtils::chop_cr(std::string_view s) {
    if (!s.empty() && s.back() == '\r') {
        s.remove_suffix(1);
    }
    return s;
}

bool StringUtils::starts_with_ci(std::string_view s, std::string_view prefix) {
    if (s.size() < prefix.size()) return false;
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(s[i])) != std::tolower(static_cast<unsigned char>(prefix[i]))) {
            return false;
        }
    }
    return true;
}

std::vector<std::string> StringUtils::split_lines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string::npos) {
            lines.emplace_back(text.substr(start));
            break;
        }
        lines.emplace_back(text.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}
