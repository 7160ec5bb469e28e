// MultilineTracker.cpp
#include "MultilineTracker.hpp"
#include "StringUtils.hpp"

namespace {
    // Index just past the closing quote, or npos if the quote doesn't close on this line.
    size_t skip_quoted(std::string_view line, size_t pos, char quote) {
        size_t i = pos + 1;
        while (i < line.size()) {
            char c = line[i];
            if (c == '\\' && quote != '\'') {
                i += 2;
                continue;
            }
            if (c == '\\' && quote == '\'' && i + 1 < line.size() &&
                (line[i + 1] == '\'' || line[i + 1] == '\\')) {
                i += 2;
                continue;
            }
            if (c == quote) {
                return i + 1;
            }
            i++;
        }
        return std::string_view::npos;
    }

    bool is_word_end(std::string_view line, size_t pos) {
        return pos >= line.size() || StringUtils::isspace(line[pos]);
    }

    size_t skip_spaces(std::string_view line, size_t pos) {
        while (pos < line.size() && StringUtils::isspace(line[pos])) {
            pos++;
        }
        return pos;
    }

    char closing_of(char open) {
        switch (open) {
        case '(': return ')';
        case '[': return ']';
        case '{': return '}';
        case '<': return '>';
        default:  return open;
        }
    }

    // Index just past the body opened by the delimiter at pos, or npos if the
    // body runs past this line. Paired delimiters nest.
    size_t skip_delimited(std::string_view line, size_t pos) {
        char open = line[pos];
        char close = closing_of(open);
        int depth = 1;
        for (size_t i = pos + 1; i < line.size(); ++i) {
            char c = line[i];
            if (c == '\\') {
                i++;
                continue;
            }
            if (open != close && c == open) {
                depth++;
                continue;
            }
            if (c == close && --depth == 0) {
                return i + 1;
            }
        }
        return std::string_view::npos;
    }

    // "/.../" where a term is expected. A '/' inside a character class does not close it.
    size_t skip_slash_pattern(std::string_view line, size_t pos) {
        bool in_class = false;
        for (size_t i = pos + 1; i < line.size(); ++i) {
            char c = line[i];
            if (c == '\\') {
                i++;
                continue;
            }
            if (in_class) {
                in_class = c != ']';
                continue;
            }
            if (c == '[') {
                in_class = true;
                continue;
            }
            if (c == '/') {
                return i + 1;
            }
        }
        return std::string_view::npos;
    }

    size_t skip_modifiers(std::string_view line, size_t pos) {
        while (pos < line.size() && StringUtils::isletter(line[pos])) {
            pos++;
        }
        return pos;
    }

    bool is_quote_operator(std::string_view word) {
        return word == "q" || word == "qq" || word == "qw" || word == "qr" ||
               word == "m" || word == "s" || word == "tr" || word == "y";
    }

    // Words after which a '/' starts a pattern instead of dividing.
    bool expects_term_after(std::string_view word) {
        static const std::string_view words[] = {
            "my", "our", "local", "and", "or", "not", "xor", "if", "elsif", "unless", "while", "until", "when",
            "return", "split", "grep", "map", "join", "push", "unshift",
            "lt", "gt", "le", "ge", "eq", "ne", "cmp"
        };
        for (auto candidate : words) {
            if (word == candidate) {
                return true;
            }
        }
        return false;
    }

    // pos points just past a quote-like operator word. Returns the index past
    // the whole construct and its modifiers, npos if it continues on the next
    // line, or pos itself if the word is not used as a quote here ($h{s}, y => 1).
    size_t skip_quote_operator(std::string_view line, size_t pos, std::string_view word) {
        size_t open = skip_spaces(line, pos);
        if (open >= line.size()) {
            return pos;
        }
        char delimiter = line[open];
        bool spaced = open > pos;
        if (StringUtils::is_ident_char(delimiter) || delimiter == ',' || delimiter == ';' ||
            delimiter == ')' || delimiter == ']' || delimiter == '}' || delimiter == '>' ||
            line.compare(open, 2, "=>") == 0 || (spaced && (delimiter == '=' || delimiter == '#'))) {
            return pos;
        }

        size_t next = skip_delimited(line, open);
        if (next == std::string_view::npos) {
            return next;
        }
        if (word == "s" || word == "tr" || word == "y") {
            if (closing_of(delimiter) == delimiter) {
                // s/a/b/: the replacement shares the middle delimiter.
                next = skip_delimited(line, next - 1);
            }
            else {
                // s{a}{b}, s{a} /b/
                size_t second = skip_spaces(line, next);
                next = second < line.size() ? skip_delimited(line, second) : std::string_view::npos;
            }
            if (next == std::string_view::npos) {
                return next;
            }
        }
        if (word == "q" || word == "qq" || word == "qw") {
            return next;
        }
        return skip_modifiers(line, next);
    }

    // $name, @name, %name, $main::x, $#array, $$ref, and punctuation
    // variables such as $/, $# or $'. Returns the index just past the name.
    size_t skip_variable(std::string_view line, size_t pos) {
        size_t i = pos + 1;
        if (line[pos] == '$' && i < line.size() && line[i] == '#') {
            i++;
        }
        while (i < line.size() && line[i] == '$') {
            i++;
        }
        if (i >= line.size() || line[i] == '{' || StringUtils::isspace(line[i])) {
            return i;
        }
        if (StringUtils::is_ident_start(line[i]) || line[i] == ':') {
            while (i < line.size() && (StringUtils::is_ident_char(line[i]) || line[i] == ':')) {
                i++;
            }
            return i;
        }
        return i + 1;
    }
}

void MultilineTracker::open_documentation(uint32_t line) {
    pod_open = true;
    pod_start = line;
}

void MultilineTracker::close_documentation() {
    pod_open = false;
    pod_start = 0;
}

bool MultilineTracker::is_pod_directive(std::string_view line) {
    return line.size() >= 2 && line[0] == '=' && StringUtils::isletter(line[1]);
}

bool MultilineTracker::is_pod_end(std::string_view line) {
    return line.substr(0, 4) == "=cut" && is_word_end(line, 4);
}

bool MultilineTracker::is_data_marker(std::string_view line) {
    std::string_view word = StringUtils::rstrip_view(line);
    return word == "__END__" || word == "__DATA__";
}

bool MultilineTracker::is_terminator(std::string_view line) const {
    if (pending.empty()) {
        return false;
    }
    const PendingMultilineConstruct& heredoc = pending.front();
    if (heredoc.indented) {
        size_t i = 0;
        while (i < line.size() && (line[i] == ' ' || line[i] == '\t')) {
            i++;
        }
        line.remove_prefix(i);
    }
    return line == heredoc.label;
}

void MultilineTracker::pop_literal() {
    if (!pending.empty()) {
        pending.pop_front();
    }
}

size_t MultilineTracker::enqueue_introducers(std::string_view line, uint32_t line_number) {
    size_t queued_before = pending.size();
    bool expect_term = true; // a '/' here would start a pattern, not divide
    std::string_view previous_word;
    size_t i = 0;

    while (i < line.size()) {
        char c = line[i];

        if (StringUtils::isspace(c)) {
            i++;
            continue;
        }

        // Comment runs to the end of the line.
        if (c == '#') {
            break;
        }

        // '%' is a hash only where a term is expected; otherwise it is modulus.
        if (c == '$' || c == '@' || (c == '%' && expect_term)) {
            i = skip_variable(line, i);
            expect_term = false;
            previous_word = {};
            continue;
        }

        if (c == '"' || c == '\'' || c == '`') {
            size_t next = skip_quoted(line, i, c);
            if (next == std::string_view::npos) {
                break; // String continues past this line
            }
            i = next;
            expect_term = false;
            previous_word = {};
            continue;
        }

        if (StringUtils::is_ident_start(c)) {
            size_t start = i;
            while (i < line.size()) {
                if (StringUtils::is_ident_char(line[i])) {
                    i++;
                }
                else if (line.compare(i, 2, "::") == 0) {
                    i += 2;
                }
                else {
                    break;
                }
            }
            std::string_view word = line.substr(start, i - start);
            bool method = start >= 2 && line.compare(start - 2, 2, "->") == 0;
            bool file_test = word.size() == 1 && start >= 1 && line[start - 1] == '-';
            if (is_quote_operator(word) && !method && !file_test && previous_word != "sub") {
                size_t next = skip_quote_operator(line, i, word);
                if (next == std::string_view::npos) {
                    break; // Quoted text continues past this line
                }
                if (next != i) {
                    i = next;
                    expect_term = false;
                    previous_word = {};
                    continue;
                }
            }
            expect_term = expects_term_after(word);
            previous_word = word;
            continue;
        }

        if (StringUtils::isdigit(c)) {
            while (i < line.size() && (StringUtils::is_ident_char(line[i]) || line[i] == '.')) {
                i++;
            }
            expect_term = false;
            previous_word = {};
            continue;
        }

        previous_word = {};

        if (c == '/') {
            if (expect_term) {
                size_t next = skip_slash_pattern(line, i);
                if (next == std::string_view::npos) {
                    break;
                }
                i = skip_modifiers(line, next);
                expect_term = false;
                continue;
            }
            // Division, "//" or "//=".
            i += (i + 1 < line.size() && line[i + 1] == '/') ? 2 : 1;
            expect_term = true;
            continue;
        }

        if (c == '<' && i + 1 < line.size() && line[i + 1] == '<') {
            size_t before = pending.size();
            size_t next = try_introducer(line, i, line_number);
            i = (next > i) ? next : i + 2;
            expect_term = pending.size() == before;
            continue;
        }

        i++;
        expect_term = !(c == ')' || c == ']' || c == '}');
    }
    return pending.size() - queued_before;
}

size_t MultilineTracker::try_introducer(std::string_view line, size_t pos, uint32_t line_number) {
    size_t i = pos + 2;
    bool indented = false;
    if (i < line.size() && line[i] == '~') {
        indented = true;
        i++;
    }

    // Whitespace is only allowed before a quoted label.
    size_t after_space = i;
    while (after_space < line.size() && (line[after_space] == ' ' || line[after_space] == '\t')) {
        after_space++;
    }

    if (after_space >= line.size()) {
        return pos;
    }

    PendingMultilineConstruct heredoc;
    heredoc.indented = indented;
    heredoc.declaration_line = line_number;

    char c = line[after_space];
    if (c == '"' || c == '\'' || c == '`') {
        size_t close = line.find(c, after_space + 1);
        if (close == std::string_view::npos) {
            return pos;
        }
        heredoc.label = std::string(line.substr(after_space + 1, close - after_space - 1));
        heredoc.style = (c == '"') ? QuoteStyle::DOUBLE : (c == '\'') ? QuoteStyle::SINGLE : QuoteStyle::BACKTICK;
        pending.push_back(std::move(heredoc));
        return close + 1;
    }

    if (after_space != i) {
        return pos; // "<< EOF" (bare label after a space) is not a heredoc
    }

    if (c == '\\') {
        i++;
        if (i >= line.size() || !StringUtils::is_ident_start(line[i])) {
            return pos;
        }
        heredoc.style = QuoteStyle::ESCAPED;
    }
    else if (StringUtils::is_ident_start(c)) {
        heredoc.style = QuoteStyle::BARE;
    }
    else {
        return pos; // 1 << 2, $x << $y, <<=, <<>>
    }

    size_t start = i;
    while (i < line.size() && StringUtils::is_ident_char(line[i])) {
        i++;
    }
    heredoc.label = std::string(line.substr(start, i - start));
    pending.push_back(std::move(heredoc));
    return i;
}

void MultilineTracker::finish(std::vector<ClassifierDiagnostic>& diagnostics) const {
    if (pod_open) {
        diagnostics.push_back({ pod_start, "Unterminated POD block (no =cut before end of file)" });
    }
    for (const auto& heredoc : pending) {
        diagnostics.push_back({ heredoc.declaration_line,
            "Unterminated heredoc: terminator '" + heredoc.label + "' not found before end of file" });
    }
}
