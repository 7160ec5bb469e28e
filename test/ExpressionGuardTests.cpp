// ExpressionGuardTests.cpp
#include <gtest/gtest.h>

#include "Error.hpp"
#include "ExpressionGuard.hpp"

namespace {
    Error::Code code_of(const std::string& expression) {
        try {
            ExpressionGuard::require_side_effect_free(expression);
        }
        catch (const Error::Failure& e) {
            return e.code();
        }
        return Error::OK;
    }

    std::string rejected_op(const std::string& expression) {
        try {
            ExpressionGuard::require_side_effect_free(expression);
        }
        catch (const Error::Failure& e) {
            return e.detail();
        }
        return "";
    }
}

TEST(ExpressionGuard, SingleLine) {
    EXPECT_TRUE(ExpressionGuard::is_single_line("$x + 1"));
    EXPECT_TRUE(ExpressionGuard::is_single_line("$x\t+ 1"));
    EXPECT_FALSE(ExpressionGuard::is_single_line("$x\nq"));
    EXPECT_FALSE(ExpressionGuard::is_single_line("$x\r"));
    EXPECT_FALSE(ExpressionGuard::is_single_line(std::string("a\0b", 3)));
}

TEST(ExpressionGuard, RequireSingleLine) {
    EXPECT_NO_THROW(ExpressionGuard::require_single_line("@list"));
    EXPECT_THROW(ExpressionGuard::require_single_line("   "), Error::Failure);
    try {
        ExpressionGuard::require_single_line("1\nq");
        FAIL() << "newline accepted";
    }
    catch (const Error::Failure& e) {
        EXPECT_EQ(e.code(), Error::INVALID_EXPRESSION);
    }
}

TEST(ExpressionGuard, SubNames) {
    EXPECT_TRUE(ExpressionGuard::is_sub_name("main"));
    EXPECT_TRUE(ExpressionGuard::is_sub_name("Foo::Bar::baz"));
    EXPECT_TRUE(ExpressionGuard::is_sub_name("_private"));
    EXPECT_FALSE(ExpressionGuard::is_sub_name("1abc"));
    EXPECT_FALSE(ExpressionGuard::is_sub_name("Foo::"));
    EXPECT_FALSE(ExpressionGuard::is_sub_name("foo bar"));
    EXPECT_FALSE(ExpressionGuard::is_sub_name(""));
}

TEST(ExpressionGuard, VariableNames) {
    EXPECT_TRUE(ExpressionGuard::is_variable_name("$x"));
    EXPECT_TRUE(ExpressionGuard::is_variable_name("@list"));
    EXPECT_TRUE(ExpressionGuard::is_variable_name("%map"));
    EXPECT_TRUE(ExpressionGuard::is_variable_name("$Foo::Bar::count"));
    EXPECT_FALSE(ExpressionGuard::is_variable_name("x"));
    EXPECT_FALSE(ExpressionGuard::is_variable_name("$"));
    EXPECT_FALSE(ExpressionGuard::is_variable_name("$x[0]"));
    EXPECT_FALSE(ExpressionGuard::is_variable_name("$x; system 'ls'"));
    EXPECT_FALSE(ExpressionGuard::is_variable_name("'name'"));
}

TEST(ExpressionGuard, ReadOnlyExpressionsPass) {
    for (const char* expression : { "$x", "$x + 1", "$h{key}", "$h->{s}", "$a[0] == 2", "$x =~ /foo/",
                                    "scalar(@list)", "join(',', @a)", "$x <= 3 && $y >= 4", "keys %h",
                                    "\"print $x\"", "$s eq 'system'", "{ a => 1 }", "$#array" }) {
        EXPECT_EQ(code_of(expression), Error::OK) << expression;
    }
}

TEST(ExpressionGuard, StateChangesAreRejected) {
    EXPECT_EQ(rejected_op("$x = 1"), "assignment");
    EXPECT_EQ(rejected_op("$x += 1"), "assignment");
    EXPECT_EQ(rejected_op("$i++"), "assignment");
    EXPECT_EQ(rejected_op("system('ls')"), "system");
    EXPECT_EQ(rejected_op("print $x"), "print");
    EXPECT_EQ(rejected_op("push @a, 1"), "push");
    EXPECT_EQ(rejected_op("eval { 1 }"), "eval");
    EXPECT_EQ(rejected_op("`ls`"), "backticks");
    EXPECT_EQ(rejected_op("$x =~ s/a/b/"), "s///");
    EXPECT_EQ(rejected_op("$x =~ tr/a-z/A-Z/"), "tr///");
    EXPECT_EQ(code_of("unlink $file"), Error::UNSAFE_EXPRESSION);
}
