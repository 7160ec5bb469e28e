// BreakpointStore.cpp
#include "BreakpointStore.hpp"
#include "BreakpointValidator.hpp"
#include "ExpressionGuard.hpp"
#include "SourceBuffer.hpp"
#include "SourceIndexCache.hpp"
#include "StringUtils.hpp"
#include "TextIO.hpp"
#include <charconv>

namespace {
    struct ParsedHitCondition {
        std::string op;
        uint64_t operand = 0;
    };

    std::optional<ParsedHitCondition> parse_hit_condition(const std::string& expression) {
        std::string_view text = StringUtils::strip_view(expression);
        static const char* const operators[] = { ">=", "<=", "==", ">", "<", "%" };

        ParsedHitCondition parsed;
        for (const char* op : operators) {
            std::string_view candidate(op);
            if (text.substr(0, candidate.size()) == candidate) {
                parsed.op = op;
                text.remove_prefix(candidate.size());
                break;
            }
        }
        text = StringUtils::strip_view(text);
        if (text.empty()) {
            return std::nullopt;
        }

        auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed.operand);
        if (ec != std::errc() || end != text.data() + text.size()) {
            return std::nullopt;
        }
        if (parsed.op == "%" && parsed.operand == 0) {
            return std::nullopt;
        }
        return parsed;
    }
}

bool HitCondition::is_valid(const std::string& expression) {
    return parse_hit_condition(expression).has_value();
}

bool HitCondition::is_met(const std::string& expression, uint64_t hit_count) {
    auto parsed = parse_hit_condition(expression);
    if (!parsed) {
        return true;
    }
    const uint64_t n = parsed->operand;
    if (parsed->op.empty() || parsed->op == "==") return hit_count == n;
    if (parsed->op == ">=") return hit_count >= n;
    if (parsed->op == "<=") return hit_count <= n;
    if (parsed->op == ">") return hit_count > n;
    if (parsed->op == "<") return hit_count < n;
    return hit_count % n == 0;
}

BreakpointStore::BreakpointStore(SourceIndex& index) : index(index) {}

const std::vector<Breakpoint>& BreakpointStore::set_breakpoints(const SourceBuffer& buffer, const std::vector<SourceBreakpoint>& requested) {
    ClassificationPtr classification = index.get_or_build(buffer);

    std::vector<Breakpoint> records;
    records.reserve(requested.size());
    for (const auto& source_bp : requested) {
        Breakpoint bp;
        bp.id = allocate_id();
        bp.source = buffer.path();
        bp.requested_line = source_bp.line;
        bp.condition = source_bp.condition;
        bp.hit_condition = source_bp.hit_condition;
        bp.log_message = source_bp.log_message;

        auto verification = BreakpointValidator::verify(*classification, source_bp.line);
        bp.verified_line = verification.line;
        bp.verified = verification.line.has_value();
        bp.message = verification.message;

        if (bp.condition && !ExpressionGuard::is_single_line(*bp.condition)) {
            bp.verified = false;
            bp.message = "Breakpoint condition cannot contain newlines or control characters";
        }
        else if (bp.hit_condition && !HitCondition::is_valid(*bp.hit_condition)) {
            bp.verified = false;
            bp.message = "Invalid hit condition: " + *bp.hit_condition;
        }
        else if (bp.log_message && !ExpressionGuard::is_single_line(*bp.log_message)) {
            bp.verified = false;
            bp.message = "Log message cannot contain newlines or control characters";
        }
        records.push_back(std::move(bp));
    }

    TextIO::debug("DAP Info: " + std::to_string(records.size()) + " breakpoint(s) in " + buffer.path() + "\n");
    auto& slot = by_file[buffer.path()];
    slot = std::move(records);
    if (slot.empty()) {
        by_file.erase(buffer.path());
        static const std::vector<Breakpoint> none;
        return none;
    }
    return slot;
}

const std::vector<FunctionBreakpoint>& BreakpointStore::set_function_breakpoints(const std::vector<FunctionBreakpoint>& requested) {
    functions.clear();
    for (const auto& wanted : requested) {
        FunctionBreakpoint fb = wanted;
        fb.id = allocate_id();
        fb.verified = ExpressionGuard::is_sub_name(fb.name);
        if (!fb.verified) {
            fb.message = "Invalid subroutine name: " + fb.name;
        }
        else if (fb.condition && !ExpressionGuard::is_single_line(*fb.condition)) {
            fb.verified = false;
            fb.message = "Breakpoint condition cannot contain newlines or control characters";
        }
        functions.push_back(std::move(fb));
    }
    return functions;
}

std::vector<Breakpoint> BreakpointStore::get_breakpoints(const std::string& path) const {
    auto it = by_file.find(path);
    return it == by_file.end() ? std::vector<Breakpoint>{} : it->second;
}

std::optional<Breakpoint> BreakpointStore::get_by_id(int64_t id) const {
    for (const auto& [path, records] : by_file) {
        for (const auto& bp : records) {
            if (bp.id == id) {
                return bp;
            }
        }
    }
    return std::nullopt;
}

std::vector<std::string> BreakpointStore::files() const {
    std::vector<std::string> paths;
    for (const auto& entry : by_file) {
        paths.push_back(entry.first);
    }
    return paths;
}

bool BreakpointStore::empty() const {
    return by_file.empty() && functions.empty();
}

BreakpointStore::HitOutcome BreakpointStore::register_hit(const std::string& path, uint32_t line) {
    HitOutcome outcome;
    auto it = by_file.find(path);
    if (it == by_file.end()) {
        return outcome;
    }

    for (auto& bp : it->second) {
        if (!bp.verified || bp.verified_line != line) {
            continue;
        }
        outcome.matched = true;
        bp.hit_count++;

        if (bp.hit_condition && !HitCondition::is_met(*bp.hit_condition, bp.hit_count)) {
            continue;
        }
        if (bp.log_message) {
            outcome.log_messages.push_back(*bp.log_message);
            continue;
        }
        outcome.should_stop = true;
        outcome.hit_ids.push_back(bp.id);
    }
    return outcome;
}

bool BreakpointStore::reject(const std::string& path, uint32_t line, const std::string& reason, Breakpoint& changed) {
    auto it = by_file.find(path);
    if (it == by_file.end()) {
        return false;
    }
    for (auto& bp : it->second) {
        if (bp.verified && bp.verified_line == line) {
            bp.verified = false;
            bp.message = reason;
            changed = bp;
            return true;
        }
    }
    return false;
}
