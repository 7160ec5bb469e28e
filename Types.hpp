// Types.hpp
#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// What a single source line is, as far as breakpoints are concerned.
enum class LineTag : uint8_t {
    EXECUTABLE,    // A statement the debugger can stop on
    COMMENT,       // Only a '#' comment (or the __END__ marker)
    BLANK,         // Empty or whitespace only
    DOCUMENTATION, // Inside a POD block, including its =cut line, or after __END__
    LITERAL_BODY   // Heredoc body or terminator; owner_line says which declaration
};

struct LineInfo {
    LineTag tag = LineTag::BLANK;
    uint32_t owner_line = 0; // Declaration line of the heredoc, for LITERAL_BODY only

    bool operator==(const LineInfo&) const = default;
};

// Soft problems found while classifying (unterminated POD or heredoc).
struct ClassifierDiagnostic {
    uint32_t line = 0;
    std::string message;

    bool operator==(const ClassifierDiagnostic&) const = default;
};

// The per-line result of one classification pass. Immutable once built;
// the cache hands it out as a shared_ptr<const ...>.
struct LineClassification {
    uint64_t fingerprint = 0;
    std::vector<LineInfo> lines; // lines[0] is line 1
    std::vector<ClassifierDiagnostic> diagnostics;

    uint32_t line_count() const { return static_cast<uint32_t>(lines.size()); }

    // 1-based access; callers check the range first.
    const LineInfo& at(uint32_t line) const { return lines[line - 1]; }
    LineTag tag(uint32_t line) const { return lines[line - 1].tag; }

    bool operator==(const LineClassification&) const = default;
};

using ClassificationPtr = std::shared_ptr<const LineClassification>;

// A line breakpoint as the client asked for it.
struct SourceBreakpoint {
    int64_t line = 0;
    std::optional<std::string> condition;
    std::optional<std::string> hit_condition;
    std::optional<std::string> log_message;
};

struct Breakpoint {
    int64_t id = 0;                         // Session-unique, monotonic
    std::string source;                     // Normalized path of the file
    int64_t requested_line = 0;
    std::optional<uint32_t> verified_line;  // Where it actually sits, if anywhere
    bool verified = false;
    std::optional<std::string> condition;
    std::optional<std::string> hit_condition;
    std::optional<std::string> log_message;
    uint64_t hit_count = 0;
    std::string message;                    // Why it is unverified or was moved
};

struct FunctionBreakpoint {
    int64_t id = 0;
    std::string name;
    std::optional<std::string> condition;
    bool verified = false;
    std::string message;
};

// --- Read-through projections of the debuggee, valid only while stopped ---

struct StackFrame {
    int id = 0;
    std::string name;
    std::string path;
    int line = 0;
    int column = 1;
};

enum class ScopeKind {
    LOCALS,
    GLOBALS
};

struct Scope {
    std::string name;
    ScopeKind kind = ScopeKind::LOCALS;
    int variables_reference = 0;
};

// Arrays, hashes and references carry the elements the dump listed below them.
struct Variable {
    std::string name;
    std::string value;
    std::string type;
    std::vector<Variable> children;
    int variables_reference = 0; // 0 means not expandable
};
