// ExpressionGuard.hpp
#pragma once
#include <string>

// Checks on text that is pasted into a perl5db command line. One stray
// newline would let a client smuggle a second debugger command.
namespace ExpressionGuard {
    // No '\n', '\r' or other control characters (tab is allowed).
    bool is_single_line(const std::string& text);

    // Foo, Foo::bar, main::baz
    bool is_sub_name(const std::string& name);

    // $x, @list, %map, $Pkg::name
    bool is_variable_name(const std::string& name);

    // Throws Error::Failure(INVALID_EXPRESSION) if the text is empty or not single-line.
    void require_single_line(const std::string& expression);

    // Throws Error::Failure(UNSAFE_EXPRESSION) naming the first operation that
    // could change program state: assignment, s///, tr///, system, print, eval, ...
    void require_side_effect_free(const std::string& expression);
}
