// ExpressionGuard.cpp
#include "ExpressionGuard.hpp"
#include "Error.hpp"
#include "StringUtils.hpp"
#include <regex>

namespace {
    const std::regex& sub_name_pattern() {
        static const std::regex pattern(R"(^[A-Za-z_]\w*(::[A-Za-z_]\w*)*$)");
        return pattern;
    }

    const std::regex& variable_name_pattern() {
        static const std::regex pattern(R"(^[$@%][A-Za-z_]\w*(::\w+)*$)");
        return pattern;
    }

    // Builtins that write, spawn, load code or touch the outside world.
    const std::regex& dangerous_ops_pattern() {
        static const std::regex pattern(
            R"((^|[^\w:$@%&])()"
            R"(push|pop|shift|unshift|splice|delete|undef|srand|bless|reset|)"
            R"(system|exec|fork|exit|dump|kill|alarm|sleep|wait|waitpid|setpgrp|setpriority|umask|lock|)"
            R"(qx|readpipe|syscall|open|close|print|say|printf|sysread|syswrite|glob|readline|ioctl|fcntl|flock|)"
            R"(select|dbmopen|dbmclose|binmode|opendir|closedir|readdir|rewinddir|seekdir|telldir|seek|sysseek|)"
            R"(formline|write|pipe|socketpair|mkdir|rmdir|unlink|rename|chdir|chmod|chown|chroot|truncate|utime|)"
            R"(symlink|link|eval|require|do|tie|untie|socket|connect|bind|listen|accept|send|recv|shutdown|)"
            R"(setsockopt|msgget|msgsnd|msgrcv|msgctl|semget|semop|semctl|shmget|shmat|shmdt|shmctl)"
            R"()\b)");
        return pattern;
    }

    // s/../../, tr/../../, y/../../ with any punctuation delimiter.
    const std::regex& mutation_pattern() {
        static const std::regex pattern(R"((^|[^\w$@%&:])(s|tr|y)\s*[^\w\s=,;)}\]])");
        return pattern;
    }

    // = that is not part of ==, !=, <=, >=, =~, <=>, =>
    // plus compound assignments and ++/--.
    bool has_assignment(const std::string& text) {
        for (size_t i = 0; i < text.size(); ++i) {
            char c = text[i];
            if ((c == '+' || c == '-') && i + 1 < text.size() && text[i + 1] == c) {
                return true;
            }
            if (c != '=') {
                continue;
            }
            char next = i + 1 < text.size() ? text[i + 1] : '\0';
            char prev = i > 0 ? text[i - 1] : '\0';
            if (next == '=' || next == '~' || next == '>') {
                ++i;
                continue;
            }
            if (prev == '=' || prev == '!' || prev == '<' || prev == '>') {
                continue;
            }
            return true;
        }
        return false;
    }

    // Blank out quoted strings so their contents can't trip the checks.
    std::string without_strings(const std::string& text) {
        std::string out = text;
        char quote = 0;
        for (size_t i = 0; i < out.size(); ++i) {
            char c = out[i];
            if (quote) {
                if (c == '\\' && i + 1 < out.size()) {
                    out[i] = ' ';
                    out[++i] = ' ';
                    continue;
                }
                if (c == quote) {
                    quote = 0;
                }
                else {
                    out[i] = ' ';
                }
            }
            else if ((c == '\'' || c == '"') && (i == 0 || (out[i - 1] != '$' && out[i - 1] != '@'))) {
                quote = c;
            }
        }
        return out;
    }
}

bool ExpressionGuard::is_single_line(const std::string& text) {
    for (unsigned char c : text) {
        if (c == '\t') {
            continue;
        }
        if (c < 0x20 || c == 0x7f) {
            return false;
        }
    }
    return true;
}

bool ExpressionGuard::is_sub_name(const std::string& name) {
    return std::regex_match(name, sub_name_pattern());
}

bool ExpressionGuard::is_variable_name(const std::string& name) {
    return std::regex_match(name, variable_name_pattern());
}

void ExpressionGuard::require_single_line(const std::string& expression) {
    if (StringUtils::strip_view(expression).empty()) {
        throw Error::Failure(Error::INVALID_EXPRESSION, "expression is empty");
    }
    if (!is_single_line(expression)) {
        throw Error::Failure(Error::INVALID_EXPRESSION, "expression cannot contain newlines or control characters");
    }
}

void ExpressionGuard::require_side_effect_free(const std::string& expression) {
    std::string code = without_strings(expression);

    if (StringUtils::contains(code, '`')) {
        throw Error::Failure(Error::UNSAFE_EXPRESSION, "backticks");
    }
    std::smatch match;
    if (std::regex_search(code, match, dangerous_ops_pattern())) {
        throw Error::Failure(Error::UNSAFE_EXPRESSION, match[2].str());
    }
    if (std::regex_search(code, match, mutation_pattern())) {
        throw Error::Failure(Error::UNSAFE_EXPRESSION, match[2].str() + "///");
    }
    if (has_assignment(code)) {
        throw Error::Failure(Error::UNSAFE_EXPRESSION, "assignment");
    }
}
