// LineClassifierTests.cpp
#include <gtest/gtest.h>

#include "BreakpointValidator.hpp"
#include "LineClassifier.hpp"
#include "SourceBuffer.hpp"

#include <chrono>
#include <string>

namespace {
    ClassificationPtr classify(const std::string& text) {
        return LineClassifier::classify(SourceBuffer("/tmp/t.pl", text));
    }
}

TEST(LineClassifier, EveryLineGetsExactlyOneTag) {
    const std::string text =
        "#!/usr/bin/perl\n"
        "use strict;\n"
        "\n"
        "=pod\n"
        "text\n"
        "=cut\n"
        "print <<EOF;\n"
        "body\n"
        "EOF\n"
        "# done\n"
        "__END__\n"
        "trailing data\n";
    auto result = classify(text);
    ASSERT_EQ(result->line_count(), 12u);
    EXPECT_EQ(result->tag(1), LineTag::COMMENT);
    EXPECT_EQ(result->tag(2), LineTag::EXECUTABLE);
    EXPECT_EQ(result->tag(3), LineTag::BLANK);
    EXPECT_EQ(result->tag(4), LineTag::DOCUMENTATION);
    EXPECT_EQ(result->tag(5), LineTag::DOCUMENTATION);
    EXPECT_EQ(result->tag(6), LineTag::DOCUMENTATION);
    EXPECT_EQ(result->tag(7), LineTag::EXECUTABLE);
    EXPECT_EQ(result->tag(8), LineTag::LITERAL_BODY);
    EXPECT_EQ(result->tag(9), LineTag::LITERAL_BODY);
    EXPECT_EQ(result->at(9).owner_line, 7u);
    EXPECT_EQ(result->tag(10), LineTag::COMMENT);
    EXPECT_EQ(result->tag(11), LineTag::COMMENT);
    EXPECT_EQ(result->tag(12), LineTag::DOCUMENTATION);
    EXPECT_TRUE(result->diagnostics.empty());
}

TEST(LineClassifier, TotalOnGarbageAndEmptyInput) {
    EXPECT_EQ(classify("")->line_count(), 0u);
    auto result = classify("\x01\x02<<\n<<~\n=\n<<\"unterminated\n}}}}{{{\n\r\n");
    EXPECT_EQ(result->line_count(), 6u);
    EXPECT_EQ(result->tag(6), LineTag::BLANK);
}

TEST(LineClassifier, ReclassifyingSameBufferIsIdentical) {
    const std::string text = "my $x = <<'A' . <<\"B\";\na\nA\nb\nB\n=head1 X\n\n=cut\nprint 1;\n";
    SourceBuffer buffer("/tmp/same.pl", text);
    auto first = LineClassifier::classify(buffer);
    auto second = LineClassifier::classify(buffer);
    EXPECT_EQ(*first, *second);
    EXPECT_EQ(first->fingerprint, buffer.fingerprint());
}

TEST(LineClassifier, BeginBlockAndCalledSubAreBothExecutable) {
    const std::string text =
        "BEGIN {\n"             // 1
        "    setup();\n"        // 2
        "}\n"                   // 3
        "\n"                    // 4
        "sub setup {\n"         // 5
        "    my $x = 1;\n"      // 6
        "}\n"                   // 7
        "END { print 2; }\n";   // 8
    auto result = classify(text);
    EXPECT_EQ(result->tag(1), LineTag::EXECUTABLE);
    EXPECT_EQ(result->tag(6), LineTag::EXECUTABLE);
    EXPECT_EQ(result->tag(8), LineTag::EXECUTABLE);
    EXPECT_EQ(BreakpointValidator::validate(*result, 1), 1u);
    EXPECT_EQ(BreakpointValidator::validate(*result, 6), 6u);
}

TEST(LineClassifier, LiteralHeredocSuppressesBodyAndTerminator) {
    const std::string text =
        "my $t = <<'END_TEXT';\n"   // 1
        "my $not_code = 1;\n"       // 2
        "# not a comment\n"         // 3
        "\n"                        // 4
        "END_TEXT\n"                // 5
        "print $t;\n";              // 6
    auto result = classify(text);
    EXPECT_EQ(result->tag(1), LineTag::EXECUTABLE);
    for (uint32_t line = 2; line <= 5; ++line) {
        EXPECT_EQ(result->tag(line), LineTag::LITERAL_BODY) << "line " << line;
        EXPECT_EQ(result->at(line).owner_line, 1u);
    }
    EXPECT_EQ(result->tag(6), LineTag::EXECUTABLE);
    EXPECT_EQ(BreakpointValidator::validate(*result, 3), 6u);
}

TEST(LineClassifier, InterpolatingHeredocSuppressesBodyAndTerminator) {
    const std::string text =
        "print <<\"EOT\";\n"   // 1
        "Hello $name\n"        // 2
        "EOT\n"                // 3
        "exit 0;\n";           // 4
    auto result = classify(text);
    EXPECT_EQ(result->tag(2), LineTag::LITERAL_BODY);
    EXPECT_EQ(result->tag(3), LineTag::LITERAL_BODY);
    EXPECT_EQ(result->tag(4), LineTag::EXECUTABLE);
    EXPECT_EQ(BreakpointValidator::validate(*result, 3), 4u);
}

TEST(LineClassifier, StackedHeredocsCloseInOrder) {
    const std::string text =
        "f(<<A, <<B);\n"   // 1
        "a body\n"         // 2
        "A\n"              // 3
        "b body\n"         // 4
        "B\n"              // 5
        "g();\n";          // 6
    auto result = classify(text);
    EXPECT_EQ(result->tag(3), LineTag::LITERAL_BODY);
    EXPECT_EQ(result->tag(4), LineTag::LITERAL_BODY);
    EXPECT_EQ(result->tag(5), LineTag::LITERAL_BODY);
    EXPECT_EQ(result->tag(6), LineTag::EXECUTABLE);
}

TEST(LineClassifier, IndentedHeredocAcceptsIndentedTerminator) {
    const std::string text =
        "    my $sql = <<~SQL;\n"
        "        SELECT 1\n"
        "        SQL\n"
        "    run($sql);\n";
    auto result = classify(text);
    EXPECT_EQ(result->tag(3), LineTag::LITERAL_BODY);
    EXPECT_EQ(result->tag(4), LineTag::EXECUTABLE);
}

TEST(LineClassifier, ShiftOperatorsAreNotHeredocs) {
    const std::string text =
        "my $a = 1 << 2;\n"
        "$x <<= 3;\n"
        "my $y = $z<<$w;\n"
        "while (<<>>) { last; }\n"
        "print \"<<NOT\";\n"
        "print 1; # <<ALSO_NOT\n"
        "done();\n";
    auto result = classify(text);
    for (uint32_t line = 1; line <= result->line_count(); ++line) {
        EXPECT_EQ(result->tag(line), LineTag::EXECUTABLE) << "line " << line;
    }
}

TEST(LineClassifier, QuoteOperatorsHideHeredocMarkers) {
    const std::string text =
        "my $doc = q{write <<EOF to start};\n"   // 1
        "my @w = qw(<<A <<B);\n"                 // 2
        "my $s = qq[<<\"X\" {nested}];\n"         // 3
        "my $re = qr/<<END/i;\n"                 // 4
        "next if $line =~ m{<<END};\n"           // 5
        "(my $t = $u) =~ tr/<</>>/;\n"           // 6
        "$v =~ s{<<OLD}{<<NEW}g;\n"              // 7
        "print 1;\n";                            // 8
    auto result = classify(text);
    for (uint32_t line = 1; line <= 8; ++line) {
        EXPECT_EQ(result->tag(line), LineTag::EXECUTABLE) << "line " << line;
    }
    EXPECT_TRUE(result->diagnostics.empty());
    EXPECT_EQ(BreakpointValidator::validate(*result, 3), 3u);
}

TEST(LineClassifier, SlashPatternsHideHeredocMarkers) {
    const std::string text =
        "next if $line =~ /<<END/;\n"            // 1
        "my @parts = split /<<|[/]/, $x;\n"      // 2
        "my $half = $total / 2; my $d = $a // $b; print <<DONE;\n" // 3
        "body\n"                                 // 4
        "DONE\n"                                 // 5
        "print 1;\n";                            // 6
    auto result = classify(text);
    EXPECT_EQ(result->tag(1), LineTag::EXECUTABLE);
    EXPECT_EQ(result->tag(2), LineTag::EXECUTABLE);
    EXPECT_EQ(result->tag(3), LineTag::EXECUTABLE);
    EXPECT_EQ(result->tag(4), LineTag::LITERAL_BODY);
    EXPECT_EQ(result->tag(5), LineTag::LITERAL_BODY);
    EXPECT_EQ(result->at(4).owner_line, 3u);
    EXPECT_EQ(result->tag(6), LineTag::EXECUTABLE);
    EXPECT_TRUE(result->diagnostics.empty());
}

TEST(LineClassifier, HashInsidePatternIsNotAComment) {
    const std::string text =
        "$s =~ s/#//g; print <<EOF;\n"   // 1
        "body\n"                         // 2
        "EOF\n"                          // 3
        "$n = $#list; print <<X;\n"      // 4
        "x\n"                            // 5
        "X\n"                            // 6
        "done();\n";                     // 7
    auto result = classify(text);
    EXPECT_EQ(result->tag(2), LineTag::LITERAL_BODY);
    EXPECT_EQ(result->tag(3), LineTag::LITERAL_BODY);
    EXPECT_EQ(result->tag(5), LineTag::LITERAL_BODY);
    EXPECT_EQ(result->tag(6), LineTag::LITERAL_BODY);
    EXPECT_EQ(result->tag(7), LineTag::EXECUTABLE);
    EXPECT_EQ(BreakpointValidator::validate(*result, 2), 4u);
}

TEST(LineClassifier, QuoteOperatorNamesUsedAsWords) {
    const std::string text =
        "my %h = (s => 1, y => 2); $h{q} = -s $file; print <<A;\n"  // 1
        "a\n"                                                       // 2
        "A\n"                                                       // 3
        "$obj->y(<<B);\n"                                           // 4
        "b\n"                                                       // 5
        "B\n"                                                       // 6
        "print 2;\n";                                               // 7
    auto result = classify(text);
    EXPECT_EQ(result->tag(2), LineTag::LITERAL_BODY);
    EXPECT_EQ(result->tag(3), LineTag::LITERAL_BODY);
    EXPECT_EQ(result->tag(4), LineTag::EXECUTABLE);
    EXPECT_EQ(result->tag(5), LineTag::LITERAL_BODY);
    EXPECT_EQ(result->tag(6), LineTag::LITERAL_BODY);
    EXPECT_EQ(result->tag(7), LineTag::EXECUTABLE);
    EXPECT_TRUE(result->diagnostics.empty());
}

TEST(LineClassifier, PodBlockOnLinesSixToTwelve) {
    const std::string text =
        "use strict;\n"        // 1
        "use warnings;\n"      // 2
        "my $a = 1;\n"         // 3
        "my $b = 2;\n"         // 4
        "\n"                   // 5
        "=head1 NAME\n"        // 6
        "\n"                   // 7
        "demo - a demo\n"      // 8
        "\n"                   // 9
        "=head1 SYNOPSIS\n"    // 10
        "  demo();\n"          // 11
        "=cut\n"               // 12
        "\n"                   // 13
        "print $a + $b;\n";    // 14
    auto result = classify(text);
    for (uint32_t line = 6; line <= 12; ++line) {
        EXPECT_EQ(result->tag(line), LineTag::DOCUMENTATION) << "line " << line;
        auto verified = BreakpointValidator::validate(*result, line);
        ASSERT_TRUE(verified.has_value());
        EXPECT_GT(*verified, 12u);
    }
    EXPECT_EQ(BreakpointValidator::validate(*result, 8), 14u);
}

TEST(LineClassifier, UnterminatedConstructsLeaveDiagnostics) {
    auto pod = classify("print 1;\n=pod\nnever closed\n");
    ASSERT_EQ(pod->diagnostics.size(), 1u);
    EXPECT_EQ(pod->diagnostics[0].line, 2u);

    auto heredoc = classify("print <<EOF;\nbody\n");
    ASSERT_EQ(heredoc->diagnostics.size(), 1u);
    EXPECT_EQ(heredoc->diagnostics[0].line, 1u);
    EXPECT_EQ(heredoc->tag(2), LineTag::LITERAL_BODY);
}

TEST(LineClassifier, CrLfLineEndings) {
    auto result = classify("print <<EOF;\r\nx\r\nEOF\r\n=pod\r\n=cut\r\nprint 2;\r\n");
    EXPECT_EQ(result->tag(3), LineTag::LITERAL_BODY);
    EXPECT_EQ(result->tag(5), LineTag::DOCUMENTATION);
    EXPECT_EQ(result->tag(6), LineTag::EXECUTABLE);
}

TEST(LineClassifier, HundredThousandLinesUnderFiftyMilliseconds) {
    std::string text;
    for (int block = 0; block < 1000; ++block) {
        text += "sub f" + std::to_string(block) + " {\n";
        for (int i = 0; i < 10; ++i) {
            text += "    my $v" + std::to_string(i) + " = $_[0] + " + std::to_string(i) + "; # note\n";
        }
        text += "    return <<\"END\";\nvalue\nEND\n}\n";
        text += "=pod\n\ndocs\n\n=cut\n";
        for (int i = 0; i < 80; ++i) {
            text += "print \"line " + std::to_string(i) + "\\n\";\n";
        }
    }
    SourceBuffer buffer("/tmp/big.pl", text);

    auto start = std::chrono::steady_clock::now();
    auto result = LineClassifier::classify(buffer);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

    EXPECT_GE(result->line_count(), 100000u);
    EXPECT_TRUE(result->diagnostics.empty());
#ifdef NDEBUG
    EXPECT_LT(elapsed.count(), 50);
#else
    EXPECT_LT(elapsed.count(), 500);
#endif
}
