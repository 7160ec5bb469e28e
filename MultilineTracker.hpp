// MultilineTracker.hpp
#pragma once
#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <vector>
#include "Types.hpp"

// How a heredoc label was written. Only affects how perl would evaluate the
// body, never how the body is classified.
enum class QuoteStyle : uint8_t {
    BARE,      // <<EOF     (interpolating)
    DOUBLE,    // <<"EOF"   (interpolating)
    SINGLE,    // <<'EOF'   (literal)
    BACKTICK,  // <<`EOF`   (command)
    ESCAPED    // <<\EOF    (literal)
};

struct PendingMultilineConstruct {
    std::string label;
    QuoteStyle style = QuoteStyle::BARE;
    bool indented = false;         // <<~ : terminator may be indented
    uint32_t declaration_line = 0;
};

// Transient state carried from line to line while one buffer is classified:
// whether we are inside POD (or past __END__), and the FIFO of heredocs
// whose bodies have not started or not finished yet.
class MultilineTracker {
public:
    // --- Documentation (POD) ---
    bool in_documentation() const { return pod_open; }
    void open_documentation(uint32_t line);
    void close_documentation();

    // "=word" at column 0 starts POD wherever a statement may begin.
    static bool is_pod_directive(std::string_view line);
    // "=cut" followed by end of line or whitespace.
    static bool is_pod_end(std::string_view line);

    // --- __END__ / __DATA__ ---
    static bool is_data_marker(std::string_view line);
    bool in_data_section() const { return data_section; }
    void enter_data_section() { data_section = true; }

    // --- Heredocs ---
    bool has_pending_literal() const { return !pending.empty(); }
    const PendingMultilineConstruct& front_literal() const { return pending.front(); }

    // True if the line closes the oldest pending heredoc. The line has already
    // had its '\r' removed.
    bool is_terminator(std::string_view line) const;
    void pop_literal();

    // Scans the code part of one executable line left to right and queues
    // every heredoc it introduces. Strings, q/qq/qw/qr/m/s/tr/y bodies and
    // /.../ patterns are skipped, so neither "<<" nor "#" inside them counts.
    // Returns how many were queued.
    size_t enqueue_introducers(std::string_view line, uint32_t line_number);

    // Diagnostics for whatever is still open at end of file.
    void finish(std::vector<ClassifierDiagnostic>& diagnostics) const;

private:
    bool pod_open = false;
    uint32_t pod_start = 0;
    bool data_section = false;
    std::deque<PendingMultilineConstruct> pending;

    // Attempts to read a heredoc introducer at pos (which points at "<<").
    // On success queues it and returns the index just past the token.
    size_t try_introducer(std::string_view line, size_t pos, uint32_t line_number);
};
