// BreakpointValidator.cpp
#include "BreakpointValidator.hpp"
#include <algorithm>

namespace {
    std::optional<uint32_t> next_executable(const LineClassification& classification, uint32_t from) {
        for (uint32_t line = from; line <= classification.line_count(); ++line) {
            if (classification.tag(line) == LineTag::EXECUTABLE) {
                return line;
            }
        }
        return std::nullopt;
    }

    std::string describe(LineTag tag) {
        switch (tag) {
        case LineTag::COMMENT:
        case LineTag::BLANK:
            return "Breakpoint set on comment or blank line";
        case LineTag::DOCUMENTATION:
            return "Breakpoint set inside POD documentation";
        case LineTag::LITERAL_BODY:
            return "Breakpoint set inside heredoc content";
        case LineTag::EXECUTABLE:
            break;
        }
        return "";
    }
}

std::optional<uint32_t> BreakpointValidator::validate(const LineClassification& classification, int64_t requested_line) {
    if (requested_line < 1 || requested_line > static_cast<int64_t>(classification.line_count())) {
        return std::nullopt;
    }
    return next_executable(classification, static_cast<uint32_t>(requested_line));
}

BreakpointValidator::Verification BreakpointValidator::verify(const LineClassification& classification, int64_t requested_line) {
    Verification result;
    if (requested_line < 1) {
        result.message = "Line number must be positive";
        return result;
    }
    if (requested_line > static_cast<int64_t>(classification.line_count())) {
        result.message = "Line number exceeds file length";
        return result;
    }

    uint32_t line = static_cast<uint32_t>(requested_line);
    LineTag tag = classification.tag(line);
    result.line = next_executable(classification, line);
    if (tag == LineTag::EXECUTABLE) {
        return result;
    }

    if (result.line) {
        result.message = describe(tag) + "; moved to line " + std::to_string(*result.line);
    }
    else {
        result.message = describe(tag) + "; no executable line after line " + std::to_string(line);
    }
    return result;
}

std::vector<uint32_t> BreakpointValidator::executable_lines(const LineClassification& classification, int64_t first, int64_t last) {
    std::vector<uint32_t> lines;
    int64_t from = std::max<int64_t>(first, 1);
    int64_t to = std::min<int64_t>(last, classification.line_count());
    for (int64_t line = from; line <= to; ++line) {
        if (classification.tag(static_cast<uint32_t>(line)) == LineTag::EXECUTABLE) {
            lines.push_back(static_cast<uint32_t>(line));
        }
    }
    return lines;
}
