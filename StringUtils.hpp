// StringUtils.hpp
#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace StringUtils {
    // Checks if a character is a whitespace character.
    bool isspace(char c);

    // Checks if a character is an alphabet letter.
    bool isletter(char c);

    // Checks if a character is a decimal digit.
    bool isdigit(char c);

    // Perl identifiers: [A-Za-z_][A-Za-z0-9_]*
    bool is_ident_start(char c);
    bool is_ident_char(char c);

    // Checks if a string contains a specific character.
    bool contains(const std::string& str, char c);

    // Removes leading and trailing whitespace from a string.
    void strip(std::string& str);

    // Non-mutating variants for scanning.
    std::string_view lstrip_view(std::string_view s);
    std::string_view rstrip_view(std::string_view s);
    std::string_view strip_view(std::string_view s);

    // Drops a single trailing '\r' (CRLF files).
    std::string_view chop_cr(std::string_view s);

    bool starts_with_ci(std::string_view s, std::string_view prefix);

    // Splits on '\n'; a trailing newline does not produce an empty last line.
    std::vector<std::string> split_lines(const std::string& text);
}
