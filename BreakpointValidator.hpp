// BreakpointValidator.hpp
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "Types.hpp"

// Maps a requested line onto a line the debugger can actually stop on.
// Snapping is forward only: a breakpoint on a comment, blank line, POD or
// heredoc body lands on the next executable line below it, never above.
namespace BreakpointValidator {
    struct Verification {
        std::optional<uint32_t> line; // nullopt: cannot be verified
        std::string message;          // Empty when the requested line was executable
    };

    std::optional<uint32_t> validate(const LineClassification& classification, int64_t requested_line);

    // validate() plus an explanation for the client.
    Verification verify(const LineClassification& classification, int64_t requested_line);

    // Every executable line in [first, last], clamped to the file.
    std::vector<uint32_t> executable_lines(const LineClassification& classification, int64_t first, int64_t last);
}
