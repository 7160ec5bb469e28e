// BreakpointStoreTests.cpp
#include <gtest/gtest.h>

#include "BreakpointStore.hpp"
#include "SourceBuffer.hpp"
#include "SourceIndexCache.hpp"

namespace {
    const char* const SCRIPT =
        "my $total = 0;\n"           // 1
        "for my $i (1..10) {\n"      // 2
        "    $total += $i;\n"        // 3
        "}\n"                        // 4
        "# report\n"                 // 5
        "print $total;\n";           // 6

    SourceBreakpoint at(int64_t line) {
        SourceBreakpoint bp;
        bp.line = line;
        return bp;
    }

    class BreakpointStoreTest : public ::testing::Test {
    protected:
        SourceIndexCache cache;
        BreakpointStore store{ cache };
        SourceBuffer buffer{ "/work/loop.pl", SCRIPT };
    };
}

TEST_F(BreakpointStoreTest, ResultsComeBackInRequestOrder) {
    const auto& records = store.set_breakpoints(buffer, { at(6), at(5), at(1) });
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[0].requested_line, 6);
    EXPECT_EQ(records[0].verified_line, 6u);
    EXPECT_EQ(records[1].requested_line, 5);
    EXPECT_EQ(records[1].verified_line, 6u);
    EXPECT_TRUE(records[1].verified);
    EXPECT_FALSE(records[1].message.empty());
    EXPECT_EQ(records[2].verified_line, 1u);
    EXPECT_LT(records[0].id, records[1].id);
    EXPECT_LT(records[1].id, records[2].id);
}

TEST_F(BreakpointStoreTest, SecondCallReplacesTheFirst) {
    auto first = store.set_breakpoints(buffer, { at(1), at(3) });
    store.set_breakpoints(buffer, { at(6) });

    auto current = store.get_breakpoints("/work/loop.pl");
    ASSERT_EQ(current.size(), 1u);
    EXPECT_EQ(current[0].verified_line, 6u);
    for (const auto& old : first) {
        EXPECT_FALSE(store.get_by_id(old.id).has_value());
    }
    EXPECT_FALSE(store.register_hit("/work/loop.pl", 3).matched);
}

TEST_F(BreakpointStoreTest, EmptyRequestClearsTheFile) {
    store.set_breakpoints(buffer, { at(1) });
    EXPECT_EQ(store.files().size(), 1u);
    EXPECT_TRUE(store.set_breakpoints(buffer, {}).empty());
    EXPECT_TRUE(store.files().empty());
    EXPECT_TRUE(store.empty());
}

TEST_F(BreakpointStoreTest, IdsAreNeverReused) {
    int64_t first = store.set_breakpoints(buffer, { at(1) })[0].id;
    int64_t second = store.set_breakpoints(buffer, { at(1) })[0].id;
    EXPECT_GT(second, first);
}

TEST_F(BreakpointStoreTest, UnverifiableLineIsReported) {
    const auto& records = store.set_breakpoints(buffer, { at(0), at(40) });
    EXPECT_FALSE(records[0].verified);
    EXPECT_FALSE(records[1].verified);
    EXPECT_EQ(records[1].message, "Line number exceeds file length");
}

TEST_F(BreakpointStoreTest, MultiLineConditionIsRejected) {
    SourceBreakpoint bp = at(3);
    bp.condition = "$i == 2\nq";
    const auto& records = store.set_breakpoints(buffer, { bp });
    EXPECT_FALSE(records[0].verified);
    EXPECT_NE(records[0].message.find("newlines"), std::string::npos);
}

TEST_F(BreakpointStoreTest, HitConditionControlsStops) {
    SourceBreakpoint bp = at(3);
    bp.hit_condition = ">=3";
    int64_t id = store.set_breakpoints(buffer, { bp })[0].id;

    EXPECT_FALSE(store.register_hit("/work/loop.pl", 3).should_stop);
    EXPECT_FALSE(store.register_hit("/work/loop.pl", 3).should_stop);
    auto third = store.register_hit("/work/loop.pl", 3);
    EXPECT_TRUE(third.matched);
    EXPECT_TRUE(third.should_stop);
    ASSERT_EQ(third.hit_ids.size(), 1u);
    EXPECT_EQ(third.hit_ids[0], id);
    EXPECT_EQ(store.get_by_id(id)->hit_count, 3u);
}

TEST_F(BreakpointStoreTest, InvalidHitConditionIsUnverified) {
    SourceBreakpoint bp = at(3);
    bp.hit_condition = "sometimes";
    const auto& records = store.set_breakpoints(buffer, { bp });
    EXPECT_FALSE(records[0].verified);
    EXPECT_EQ(records[0].message, "Invalid hit condition: sometimes");
}

TEST_F(BreakpointStoreTest, LogpointNeverStops) {
    SourceBreakpoint bp = at(3);
    bp.log_message = "i is {$i}";
    store.set_breakpoints(buffer, { bp });
    auto outcome = store.register_hit("/work/loop.pl", 3);
    EXPECT_TRUE(outcome.matched);
    EXPECT_FALSE(outcome.should_stop);
    ASSERT_EQ(outcome.log_messages.size(), 1u);
    EXPECT_EQ(outcome.log_messages[0], "i is {$i}");
}

TEST_F(BreakpointStoreTest, SnappedBreakpointIsHitOnItsVerifiedLine) {
    int64_t id = store.set_breakpoints(buffer, { at(5) })[0].id;
    auto outcome = store.register_hit("/work/loop.pl", 6);
    EXPECT_TRUE(outcome.should_stop);
    EXPECT_EQ(outcome.hit_ids, std::vector<int64_t>{ id });
}

TEST_F(BreakpointStoreTest, RejectMarksUnverified) {
    store.set_breakpoints(buffer, { at(1) });
    Breakpoint changed;
    EXPECT_TRUE(store.reject("/work/loop.pl", 1, "Line 1 not breakable.", changed));
    EXPECT_FALSE(changed.verified);
    EXPECT_EQ(changed.message, "Line 1 not breakable.");
    EXPECT_FALSE(store.reject("/work/loop.pl", 1, "again", changed));
    EXPECT_FALSE(store.register_hit("/work/loop.pl", 1).matched);
}

TEST_F(BreakpointStoreTest, FunctionBreakpointNamesAreChecked) {
    FunctionBreakpoint good;
    good.name = "My::Module::run";
    FunctionBreakpoint bad;
    bad.name = "run; system('x')";
    const auto& records = store.set_function_breakpoints({ good, bad });
    ASSERT_EQ(records.size(), 2u);
    EXPECT_TRUE(records[0].verified);
    EXPECT_FALSE(records[1].verified);
    EXPECT_EQ(records[1].message, "Invalid subroutine name: run; system('x')");
}

TEST(HitCondition, Forms) {
    EXPECT_TRUE(HitCondition::is_met("3", 3));
    EXPECT_FALSE(HitCondition::is_met("3", 4));
    EXPECT_TRUE(HitCondition::is_met("==2", 2));
    EXPECT_TRUE(HitCondition::is_met(">2", 3));
    EXPECT_FALSE(HitCondition::is_met(">2", 2));
    EXPECT_TRUE(HitCondition::is_met("<=2", 1));
    EXPECT_TRUE(HitCondition::is_met("< 2", 1));
    EXPECT_TRUE(HitCondition::is_met("%3", 6));
    EXPECT_FALSE(HitCondition::is_met("%3", 7));
    EXPECT_FALSE(HitCondition::is_valid("%0"));
    EXPECT_FALSE(HitCondition::is_valid(""));
    EXPECT_FALSE(HitCondition::is_valid(">x"));
    EXPECT_TRUE(HitCondition::is_met("bogus", 1));
}
