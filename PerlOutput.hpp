// PerlOutput.hpp
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "Types.hpp"

// Parsers for what perl5db.pl prints on its console.
namespace PerlOutput {
    // "main::foo(lib/t.pl:12):" -> { "main::foo", "lib/t.pl", 12 }
    struct Location {
        std::string function;
        std::string path;
        uint32_t line = 0;
    };

    // One line of the "T" command.
    struct CallerEntry {
        std::string function;
        std::string args;
        std::string path;
        uint32_t line = 0;
    };

    std::string strip_ansi(const std::string& text);

    // "  DB<12> " on a line of its own.
    bool is_prompt(std::string_view text);

    // If the unterminated tail of the output ends in a prompt, where the prompt starts.
    std::optional<size_t> find_trailing_prompt(std::string_view partial);

    std::optional<Location> parse_location(const std::string& line);

    // "14:    more_code();" continuation of a listed statement.
    bool is_source_echo(const std::string& line);

    std::vector<CallerEntry> parse_backtrace(const std::string& text);

    // Frame 0 is the stop location; frame n+1 is the caller recorded in entry n.
    // Frame ids are level + 1.
    std::vector<StackFrame> build_frames(const Location& current, const std::vector<CallerEntry>& callers);

    // "y" and "V" dumps. A listed array or hash gets a folded preview as its
    // value; elements indented below an array, hash or reference become its
    // children, nested as deep as the dump goes.
    std::vector<Variable> parse_variables(const std::string& text);

    // Result of "x expr" with the leading element index removed.
    std::string parse_evaluation(const std::string& text);

    bool is_termination_notice(const std::string& line);

    // "Line 5 not breakable." -> 5
    std::optional<uint32_t> parse_not_breakable(const std::string& line);

    // "Subroutine main::nosuch not found."
    bool is_missing_subroutine(const std::string& line);

    bool looks_like_exception(const std::string& line);
}
