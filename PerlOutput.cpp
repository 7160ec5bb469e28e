// PerlOutput.cpp
#include "PerlOutput.hpp"
#include "StringUtils.hpp"
#include <cctype>
#include <regex>

// Lines can be as long as anything the debuggee prints, so everything that
// sees program output is scanned by hand. std::regex is kept for the short
// breakpoint notices and only ever sees a bounded prefix of a line.
namespace {
    constexpr size_t MAX_NOTICE_LENGTH = 1024;
    constexpr int MAX_DUMP_DEPTH = 32;
    constexpr size_t MAX_PREVIEW_ITEMS = 50;

    const std::regex not_breakable_re(R"(^\s*Line\s+(\d+)(?:\s+of\s+'[^']*')?\s+not\s+breakable)");
    const std::regex missing_sub_re(R"(^\s*Subroutine\s+\S+\s+not\s+found)");

    enum class Container { NONE, ARRAY, HASH, REFERENCE };

    struct DumpLine {
        size_t indent = 0;
        std::string text;
    };

    std::string notice_head(const std::string& line) {
        return line.size() > MAX_NOTICE_LENGTH ? line.substr(0, MAX_NOTICE_LENGTH) : line;
    }

    uint32_t to_line(std::string_view digits) {
        uint64_t value = 0;
        for (char c : digits) {
            value = value * 10 + static_cast<uint64_t>(c - '0');
            if (value > UINT32_MAX) {
                return 0;
            }
        }
        return static_cast<uint32_t>(value);
    }

    // Length of the run of digits starting at pos.
    size_t digits_at(std::string_view s, size_t pos) {
        size_t end = pos;
        while (end < s.size() && StringUtils::isdigit(s[end])) {
            end++;
        }
        return end - pos;
    }

    size_t skip_spaces(std::string_view s, size_t pos) {
        while (pos < s.size() && StringUtils::isspace(s[pos])) {
            pos++;
        }
        return pos;
    }

    // "DB<12>" or "DB<<3>>" plus trailing blanks, starting at pos. Returns the
    // end of the match or npos.
    size_t scan_prompt(std::string_view s, size_t pos) {
        if (s.compare(pos, 2, "DB") != 0) {
            return std::string_view::npos;
        }
        size_t i = pos + 2;
        size_t opens = 0;
        while (i < s.size() && s[i] == '<') {
            i++;
            opens++;
        }
        size_t count = digits_at(s, i);
        if (opens == 0 || count == 0) {
            return std::string_view::npos;
        }
        i += count;
        size_t closes = 0;
        while (i < s.size() && s[i] == '>') {
            i++;
            closes++;
        }
        if (closes == 0) {
            return std::string_view::npos;
        }
        return skip_spaces(s, i);
    }

    // ":12):" at pos; on success the line number is stored and the end returned.
    size_t scan_line_suffix(std::string_view s, size_t pos, uint32_t& line) {
        if (pos >= s.size() || s[pos] != ':') {
            return std::string_view::npos;
        }
        size_t count = digits_at(s, pos + 1);
        if (count == 0 || s.compare(pos + 1 + count, 2, "):") != 0) {
            return std::string_view::npos;
        }
        line = to_line(s.substr(pos + 1, count));
        return pos + 1 + count + 2;
    }

    // Whole-word, case-insensitive search in already lowered text.
    bool contains_word(const std::string& lowered, const std::string& word) {
        size_t at = lowered.find(word);
        while (at != std::string::npos) {
            bool starts = at == 0 || !StringUtils::is_ident_char(lowered[at - 1]);
            size_t end = at + word.size();
            bool ends = end == lowered.size() || !StringUtils::is_ident_char(lowered[end]);
            if (starts && ends) {
                return true;
            }
            at = lowered.find(word, at + 1);
        }
        return false;
    }

    // " at t.pl line 9." on a line of its own.
    bool is_bare_at_line(std::string_view s) {
        s = StringUtils::strip_view(s);
        if (s.size() < 3 || s.compare(0, 2, "at") != 0 || !StringUtils::isspace(s[2])) {
            return false;
        }
        size_t i = skip_spaces(s, 2);
        size_t path_start = i;
        while (i < s.size() && !StringUtils::isspace(s[i])) {
            i++;
        }
        if (i == path_start || i == s.size()) {
            return false;
        }
        i = skip_spaces(s, i);
        if (s.compare(i, 4, "line") != 0 || i + 4 >= s.size() || !StringUtils::isspace(s[i + 4])) {
            return false;
        }
        i = skip_spaces(s, i + 4);
        size_t count = digits_at(s, i);
        if (count == 0) {
            return false;
        }
        i += count;
        if (i < s.size() && s[i] == '.') {
            i++;
        }
        return i == s.size();
    }

    std::string type_of(char sigil) {
        switch (sigil) {
        case '@': return "array";
        case '%': return "hash";
        default:  return "scalar";
        }
    }

    // ARRAY(0x55d0), My::Obj=HASH(0x55d0), SCALAR(0x55d0), REF(0x55d0)
    Container container_of(const std::string& value, std::string* class_name = nullptr) {
        size_t open = value.find("(0x");
        if (open == std::string::npos || value.back() != ')') {
            return Container::NONE;
        }
        std::string_view kind(value.data(), open);
        size_t equals = kind.rfind('=');
        if (equals != std::string_view::npos) {
            if (class_name) {
                *class_name = std::string(kind.substr(0, equals));
            }
            kind.remove_prefix(equals + 1);
        }
        if (kind == "ARRAY") return Container::ARRAY;
        if (kind == "HASH") return Container::HASH;
        if (kind == "SCALAR" || kind == "REF") return Container::REFERENCE;
        return Container::NONE;
    }

    std::string type_of_value(const std::string& value) {
        std::string class_name;
        switch (container_of(value, &class_name)) {
        case Container::ARRAY:     return class_name.empty() ? "ARRAY" : class_name;
        case Container::HASH:      return class_name.empty() ? "HASH" : class_name;
        case Container::REFERENCE: return class_name.empty() ? "REF" : class_name;
        default:                   return "scalar";
        }
    }

    std::string join(const std::vector<std::string>& items, const std::string& separator) {
        std::string out;
        for (size_t i = 0; i < items.size(); ++i) {
            if (i) out += separator;
            out += items[i];
        }
        return out;
    }

    // "$name = value" at the start of a dump line.
    std::optional<Variable> parse_assignment(std::string_view s) {
        if (s.empty() || (s[0] != '$' && s[0] != '@' && s[0] != '%')) {
            return std::nullopt;
        }
        size_t i = 1;
        while (i < s.size() && (StringUtils::is_ident_char(s[i]) || s[i] == ':')) {
            i++;
        }
        if (i == 1) {
            return std::nullopt;
        }
        size_t equals = skip_spaces(s, i);
        if (equals >= s.size() || s[equals] != '=') {
            return std::nullopt;
        }
        Variable variable;
        variable.name = std::string(s.substr(0, i));
        variable.value = std::string(StringUtils::strip_view(s.substr(equals + 1)));
        variable.type = variable.name[0] == '$' ? type_of_value(variable.value) : type_of(variable.name[0]);
        return variable;
    }

    // One element below a container: "0  'a'" in an array, "'key' => 1" in a
    // hash, "-> 5" below a scalar reference.
    std::optional<Variable> parse_element(const std::string& text, Container parent) {
        Variable element;
        switch (parent) {
        case Container::ARRAY: {
            size_t count = digits_at(text, 0);
            if (count == 0 || count == text.size() || !StringUtils::isspace(text[count])) {
                return std::nullopt;
            }
            element.name = "[" + text.substr(0, count) + "]";
            element.value = std::string(StringUtils::strip_view(std::string_view(text).substr(count)));
            break;
        }
        case Container::HASH: {
            size_t arrow = text.find(" => ");
            if (arrow == std::string::npos) {
                return std::nullopt;
            }
            element.name = text.substr(0, arrow);
            element.value = std::string(StringUtils::strip_view(std::string_view(text).substr(arrow + 4)));
            break;
        }
        case Container::REFERENCE:
            if (text.compare(0, 2, "->") != 0) {
                return std::nullopt;
            }
            element.name = "->";
            element.value = std::string(StringUtils::strip_view(std::string_view(text).substr(2)));
            break;
        case Container::NONE:
            return std::nullopt;
        }
        element.type = type_of_value(element.value);
        return element;
    }

    // Lines indented deeper than parent_indent belong to the parent.
    std::vector<Variable> parse_children(const std::vector<DumpLine>& lines, size_t& at,
                                         size_t parent_indent, Container kind, int depth) {
        std::vector<Variable> children;
        while (at < lines.size() && lines[at].indent > parent_indent) {
            const DumpLine& line = lines[at++];
            if (depth > MAX_DUMP_DEPTH) {
                continue;
            }
            auto element = parse_element(line.text, kind);
            if (!element) {
                continue;
            }
            Container nested = container_of(element->value);
            if (nested != Container::NONE) {
                element->children = parse_children(lines, at, line.indent, nested, depth + 1);
            }
            children.push_back(std::move(*element));
        }
        return children;
    }

    // "(1, 'two')" or "('verbose' => 1)"
    std::string preview(const std::vector<Variable>& children, Container kind) {
        std::vector<std::string> items;
        for (const auto& child : children) {
            if (items.size() == MAX_PREVIEW_ITEMS) {
                items.push_back("...");
                break;
            }
            items.push_back(kind == Container::HASH ? child.name + " => " + child.value : child.value);
        }
        return "(" + join(items, ", ") + ")";
    }
}

std::string PerlOutput::strip_ansi(const std::string& text) {
    if (text.find('\x1B') == std::string::npos) {
        return text;
    }
    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        if (text[i] == '\x1B' && i + 1 < text.size() && text[i + 1] == '[') {
            size_t j = i + 2;
            while (j < text.size() && (StringUtils::isdigit(text[j]) || text[j] == ';')) {
                j++;
            }
            if (j < text.size() && StringUtils::isletter(text[j])) {
                i = j + 1;
                continue;
            }
        }
        out += text[i++];
    }
    return out;
}

bool PerlOutput::is_prompt(std::string_view text) {
    size_t start = skip_spaces(text, 0);
    return scan_prompt(text, start) == text.size();
}

std::optional<size_t> PerlOutput::find_trailing_prompt(std::string_view partial) {
    size_t at = partial.rfind("DB<");
    if (at == std::string_view::npos || scan_prompt(partial, at) != partial.size()) {
        return std::nullopt;
    }
    while (at > 0 && StringUtils::isspace(partial[at - 1])) {
        at--;
    }
    return at;
}

std::optional<PerlOutput::Location> PerlOutput::parse_location(const std::string& line) {
    std::string_view s(line);
    if (s.empty() || !StringUtils::is_ident_start(s[0])) {
        return std::nullopt;
    }
    size_t i = 1;
    while (i < s.size() && (StringUtils::is_ident_char(s[i]) || s[i] == ':')) {
        i++;
    }
    // Anonymous subs print as "main::__ANON__[t.pl:5]".
    if (i < s.size() && s[i] == '[') {
        size_t close = s.find(']', i);
        if (close == std::string_view::npos) {
            return std::nullopt;
        }
        i = close + 1;
    }
    if (i >= s.size() || s[i] != '(') {
        return std::nullopt;
    }

    Location location;
    location.function = std::string(s.substr(0, i));
    // Top-level code prints as "main::(" with an empty sub name.
    if (location.function.size() > 2 && location.function.compare(location.function.size() - 2, 2, "::") == 0) {
        location.function.resize(location.function.size() - 2);
    }

    size_t path_start = i + 1;
    size_t path_end = std::string_view::npos;
    if (s.compare(path_start, 6, "(eval ") == 0) {
        // "(eval 5)[t.pl:3]"
        size_t close = s.find(")[", path_start);
        size_t bracket = close == std::string_view::npos ? close : s.find(']', close + 2);
        if (bracket == std::string_view::npos || bracket == close + 2) {
            return std::nullopt;
        }
        path_end = bracket + 1;
        if (scan_line_suffix(s, path_end, location.line) == std::string_view::npos) {
            return std::nullopt;
        }
    }
    else {
        // The first ":<digits>):" ends the path; the path holds no parentheses.
        for (size_t j = path_start; j < s.size(); ++j) {
            if (s[j] == '(' || s[j] == ')') {
                return std::nullopt;
            }
            if (j > path_start && scan_line_suffix(s, j, location.line) != std::string_view::npos) {
                path_end = j;
                break;
            }
        }
        if (path_end == std::string_view::npos) {
            return std::nullopt;
        }
    }
    location.path = std::string(s.substr(path_start, path_end - path_start));
    if (location.line == 0) {
        return std::nullopt;
    }
    return location;
}

bool PerlOutput::is_source_echo(const std::string& line) {
    size_t count = digits_at(line, 0);
    return count > 0 && count + 1 < line.size() && line[count] == ':' && StringUtils::isspace(line[count + 1]);
}

std::vector<PerlOutput::CallerEntry> PerlOutput::parse_backtrace(const std::string& text) {
    static const std::string marker = "called from file";

    std::vector<CallerEntry> entries;
    for (const auto& raw : StringUtils::split_lines(text)) {
        std::string_view line = StringUtils::lstrip_view(StringUtils::chop_cr(raw));
        // "$ = ", "@ = " or ". = " by calling context.
        if (line.empty() || (line[0] != '$' && line[0] != '@' && line[0] != '.')) {
            continue;
        }
        size_t equals = skip_spaces(line, 1);
        if (equals >= line.size() || line[equals] != '=') {
            continue;
        }
        size_t call_start = skip_spaces(line, equals + 1);
        size_t called = line.find(marker, call_start);
        while (called != std::string_view::npos && (called == call_start || !StringUtils::isspace(line[called - 1]))) {
            called = line.find(marker, called + 1);
        }
        if (called == std::string_view::npos) {
            continue;
        }
        size_t quote = skip_spaces(line, called + marker.size());
        if (quote >= line.size() || (line[quote] != '\'' && line[quote] != '`')) {
            continue;
        }

        // The path runs to the last quote that is followed by "line N".
        size_t close = line.rfind('\'');
        uint32_t line_number = 0;
        while (close != std::string_view::npos && close > quote + 1) {
            size_t after = skip_spaces(line, close + 1);
            if (after > close + 1 && line.compare(after, 4, "line") == 0) {
                size_t number = skip_spaces(line, after + 4);
                size_t count = digits_at(line, number);
                if (number > after + 4 && count > 0) {
                    line_number = to_line(line.substr(number, count));
                    break;
                }
            }
            close = line.rfind('\'', close - 1);
        }
        if (line_number == 0) {
            continue;
        }

        CallerEntry entry;
        entry.function = std::string(StringUtils::rstrip_view(line.substr(call_start, called - call_start)));
        size_t open = entry.function.find('(');
        if (open != std::string::npos && entry.function.back() == ')') {
            entry.args = entry.function.substr(open + 1, entry.function.size() - open - 2);
            entry.function.resize(open);
        }
        entry.path = std::string(line.substr(quote + 1, close - quote - 1));
        entry.line = line_number;
        entries.push_back(std::move(entry));
    }
    return entries;
}

std::vector<StackFrame> PerlOutput::build_frames(const Location& current, const std::vector<CallerEntry>& callers) {
    std::vector<StackFrame> frames;
    StackFrame top;
    top.id = 1;
    top.name = current.function.empty() ? "main" : current.function;
    top.path = current.path;
    top.line = static_cast<int>(current.line);
    frames.push_back(top);

    for (size_t i = 0; i < callers.size(); ++i) {
        StackFrame frame;
        frame.id = static_cast<int>(i) + 2;
        frame.name = i + 1 < callers.size() ? callers[i + 1].function : "main";
        frame.path = callers[i].path;
        frame.line = static_cast<int>(callers[i].line);
        frames.push_back(frame);
    }
    return frames;
}

std::vector<Variable> PerlOutput::parse_variables(const std::string& text) {
    std::vector<DumpLine> lines;
    for (const auto& raw : StringUtils::split_lines(text)) {
        std::string line = strip_ansi(std::string(StringUtils::chop_cr(raw)));
        size_t indent = skip_spaces(line, 0);
        if (indent == line.size()) {
            continue;
        }
        lines.push_back({ indent, std::string(StringUtils::rstrip_view(std::string_view(line).substr(indent))) });
    }

    std::vector<Variable> variables;
    size_t at = 0;
    while (at < lines.size()) {
        const DumpLine& line = lines[at++];
        auto variable = parse_assignment(line.text);
        if (!variable) {
            continue; // ")" closers and anything dumpvar adds around the values
        }
        bool listed = variable->value == "(";
        Container kind = listed ? (variable->name[0] == '%' ? Container::HASH : Container::ARRAY)
                                : container_of(variable->value);
        if (kind != Container::NONE) {
            variable->children = parse_children(lines, at, line.indent, kind, 1);
        }
        if (listed) {
            variable->value = preview(variable->children, kind);
        }
        variables.push_back(std::move(*variable));
    }
    return variables;
}

std::string PerlOutput::parse_evaluation(const std::string& text) {
    std::vector<std::string> lines;
    for (const auto& raw : StringUtils::split_lines(text)) {
        std::string line = strip_ansi(raw);
        if (!StringUtils::strip_view(line).empty()) {
            lines.push_back(std::string(StringUtils::rstrip_view(line)));
        }
    }
    if (lines.empty()) {
        return "";
    }
    // "0  42": a single value behind its list index.
    std::string_view first = StringUtils::lstrip_view(lines[0]);
    if (lines.size() == 1 && first.size() >= 3 && first[0] == '0' &&
        StringUtils::isspace(first[1]) && StringUtils::isspace(first[2])) {
        return std::string(first.substr(3));
    }
    return join(lines, "\n");
}

bool PerlOutput::is_termination_notice(const std::string& line) {
    return line.find("Debugged program terminated") != std::string::npos;
}

std::optional<uint32_t> PerlOutput::parse_not_breakable(const std::string& line) {
    std::string head = notice_head(line);
    std::smatch match;
    if (!std::regex_search(head, match, not_breakable_re)) {
        return std::nullopt;
    }
    return to_line(match[1].str());
}

bool PerlOutput::is_missing_subroutine(const std::string& line) {
    std::string head = notice_head(line);
    return std::regex_search(head, missing_sub_re);
}

bool PerlOutput::looks_like_exception(const std::string& line) {
    std::string lowered(line.size(), '\0');
    for (size_t i = 0; i < line.size(); ++i) {
        lowered[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(line[i])));
    }
    return contains_word(lowered, "died") || contains_word(lowered, "uncaught exception") ||
           contains_word(lowered, "panic") || is_bare_at_line(lowered);
}
