// BreakpointValidatorTests.cpp
#include <gtest/gtest.h>

#include "BreakpointValidator.hpp"
#include "LineClassifier.hpp"

namespace {
    const char* const SAMPLE =
        "use strict;\n"          // 1
        "\n"                     // 2
        "# comment\n"            // 3
        "my $x = <<EOF;\n"       // 4
        "text\n"                 // 5
        "EOF\n"                  // 6
        "=head1 DOC\n"           // 7
        "=cut\n"                 // 8
        "print $x;\n"            // 9
        "\n"                     // 10
        "# trailing comment\n";  // 11
}

TEST(BreakpointValidator, ExecutableLineIsKept) {
    auto c = LineClassifier::classify_text(SAMPLE);
    EXPECT_EQ(BreakpointValidator::validate(*c, 1), 1u);
    EXPECT_EQ(BreakpointValidator::validate(*c, 9), 9u);
    EXPECT_TRUE(BreakpointValidator::verify(*c, 9).message.empty());
}

TEST(BreakpointValidator, SnapsForwardOnly) {
    auto c = LineClassifier::classify_text(SAMPLE);
    EXPECT_EQ(BreakpointValidator::validate(*c, 2), 4u);
    EXPECT_EQ(BreakpointValidator::validate(*c, 5), 9u);
    EXPECT_EQ(BreakpointValidator::validate(*c, 7), 9u);
    EXPECT_FALSE(BreakpointValidator::validate(*c, 10).has_value());
}

TEST(BreakpointValidator, OutOfRangeLines) {
    auto c = LineClassifier::classify_text(SAMPLE);
    EXPECT_FALSE(BreakpointValidator::validate(*c, 0).has_value());
    EXPECT_FALSE(BreakpointValidator::validate(*c, -3).has_value());
    EXPECT_FALSE(BreakpointValidator::validate(*c, 12).has_value());
    EXPECT_EQ(BreakpointValidator::verify(*c, 0).message, "Line number must be positive");
    EXPECT_EQ(BreakpointValidator::verify(*c, 500).message, "Line number exceeds file length");
}

TEST(BreakpointValidator, MessagesExplainTheMove) {
    auto c = LineClassifier::classify_text(SAMPLE);
    EXPECT_EQ(BreakpointValidator::verify(*c, 3).message, "Breakpoint set on comment or blank line; moved to line 4");
    EXPECT_EQ(BreakpointValidator::verify(*c, 5).message, "Breakpoint set inside heredoc content; moved to line 9");
    EXPECT_EQ(BreakpointValidator::verify(*c, 8).message, "Breakpoint set inside POD documentation; moved to line 9");
    EXPECT_EQ(BreakpointValidator::verify(*c, 11).message,
              "Breakpoint set on comment or blank line; no executable line after line 11");
}

TEST(BreakpointValidator, NeverReturnsANonExecutableLine) {
    auto c = LineClassifier::classify_text(SAMPLE);
    for (int64_t requested = -1; requested <= 13; ++requested) {
        auto verified = BreakpointValidator::validate(*c, requested);
        if (!verified) {
            continue;
        }
        EXPECT_EQ(c->tag(*verified), LineTag::EXECUTABLE);
        EXPECT_GE(static_cast<int64_t>(*verified), requested);
        for (int64_t between = requested; between < static_cast<int64_t>(*verified); ++between) {
            EXPECT_NE(c->tag(static_cast<uint32_t>(between)), LineTag::EXECUTABLE);
        }
    }
}

TEST(BreakpointValidator, ExecutableLinesInRange) {
    auto c = LineClassifier::classify_text(SAMPLE);
    EXPECT_EQ(BreakpointValidator::executable_lines(*c, 1, 11), (std::vector<uint32_t>{ 1, 4, 9 }));
    EXPECT_EQ(BreakpointValidator::executable_lines(*c, 2, 8), (std::vector<uint32_t>{ 4 }));
    EXPECT_EQ(BreakpointValidator::executable_lines(*c, -5, 100), (std::vector<uint32_t>{ 1, 4, 9 }));
    EXPECT_TRUE(BreakpointValidator::executable_lines(*c, 10, 11).empty());
}
