// BreakpointStore.hpp
#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "Types.hpp"

class SourceBuffer;
class SourceIndex;

// The per-session breakpoint registry. Owned by one DebugSession and only
// touched from its loop, so there is no locking here.
class BreakpointStore {
public:
    // What happened when the debuggee stopped on a line that carries breakpoints.
    struct HitOutcome {
        bool matched = false;              // At least one breakpoint sits on the line
        bool should_stop = false;          // False: every match was a logpoint or an unmet hit condition
        std::vector<int64_t> hit_ids;
        std::vector<std::string> log_messages;
    };

    explicit BreakpointStore(SourceIndex& index);

    // Replaces every line breakpoint of the buffer's file with the requested
    // set and returns the new records in request order. An empty request
    // clears the file.
    const std::vector<Breakpoint>& set_breakpoints(const SourceBuffer& buffer, const std::vector<SourceBreakpoint>& requested);

    // Replaces all function breakpoints.
    const std::vector<FunctionBreakpoint>& set_function_breakpoints(const std::vector<FunctionBreakpoint>& requested);

    std::vector<Breakpoint> get_breakpoints(const std::string& path) const;
    std::optional<Breakpoint> get_by_id(int64_t id) const;
    const std::vector<FunctionBreakpoint>& function_breakpoints() const { return functions; }

    // Every file that currently has line breakpoints.
    std::vector<std::string> files() const;

    bool empty() const;

    // Counts a stop at path:line against the verified breakpoints on that line
    // and decides whether the stop is shown to the client.
    HitOutcome register_hit(const std::string& path, uint32_t line);

    // Marks a breakpoint unverified after the debugger refused it.
    // Returns false if no such breakpoint exists.
    bool reject(const std::string& path, uint32_t line, const std::string& reason, Breakpoint& changed);

private:
    SourceIndex& index;
    int64_t next_id = 1;
    std::map<std::string, std::vector<Breakpoint>> by_file;
    std::vector<FunctionBreakpoint> functions;

    int64_t allocate_id() { return next_id++; }
};

// Hit condition syntax: "N", ">N", ">=N", "==N", "<N", "<=N", "%N".
namespace HitCondition {
    bool is_valid(const std::string& expression);
    // An invalid expression never suppresses a stop.
    bool is_met(const std::string& expression, uint64_t hit_count);
}
