// LineClassifier.cpp
#include "LineClassifier.hpp"
#include "MultilineTracker.hpp"
#include "SourceBuffer.hpp"
#include "StringUtils.hpp"
#include <algorithm>
#include <string_view>

namespace {
    LineInfo classify_code_line(std::string_view raw, uint32_t line_number, MultilineTracker& tracker) {
        std::string_view line = StringUtils::chop_cr(raw);

        // POD can only open at column 0.
        if (MultilineTracker::is_pod_directive(line)) {
            // A stray "=cut" opens and closes on the same line.
            if (!MultilineTracker::is_pod_end(line)) {
                tracker.open_documentation(line_number);
            }
            return { LineTag::DOCUMENTATION, 0 };
        }

        if (MultilineTracker::is_data_marker(line)) {
            tracker.enter_data_section();
            return { LineTag::COMMENT, 0 };
        }

        std::string_view code = StringUtils::lstrip_view(line);
        if (code.empty()) {
            return { LineTag::BLANK, 0 };
        }
        if (code.front() == '#') {
            return { LineTag::COMMENT, 0 };
        }

        // BEGIN/END/INIT/CHECK/UNITCHECK headers land here too: they are
        // ordinary stop points no matter when perl runs them.
        tracker.enqueue_introducers(code, line_number);
        return { LineTag::EXECUTABLE, 0 };
    }
}

ClassificationPtr LineClassifier::classify(const SourceBuffer& buffer) {
    return classify_text(buffer.bytes(), buffer.fingerprint());
}

ClassificationPtr LineClassifier::classify_text(const std::string& text, uint64_t fingerprint) {
    auto result = std::make_shared<LineClassification>();
    result->fingerprint = fingerprint;
    result->lines.reserve(std::count(text.begin(), text.end(), '\n') + 1);

    MultilineTracker tracker;
    std::string_view rest(text);
    uint32_t line_number = 0;

    while (!rest.empty()) {
        size_t newline = rest.find('\n');
        std::string_view raw = rest.substr(0, newline);
        rest = (newline == std::string_view::npos) ? std::string_view() : rest.substr(newline + 1);
        line_number++;

        LineInfo info;
        if (tracker.in_data_section()) {
            info = { LineTag::DOCUMENTATION, 0 };
        }
        else if (tracker.in_documentation()) {
            std::string_view line = StringUtils::chop_cr(raw);
            if (MultilineTracker::is_pod_end(line)) {
                tracker.close_documentation();
            }
            info = { LineTag::DOCUMENTATION, 0 };
        }
        else if (tracker.has_pending_literal()) {
            // The terminator belongs to the literal, not to the code after it.
            info = { LineTag::LITERAL_BODY, tracker.front_literal().declaration_line };
            if (tracker.is_terminator(StringUtils::chop_cr(raw))) {
                tracker.pop_literal();
            }
        }
        else {
            info = classify_code_line(raw, line_number, tracker);
        }
        result->lines.push_back(info);
    }

    tracker.finish(result->diagnostics);
    return result;
}
