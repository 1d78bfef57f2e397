/**
 * @file test_rule.cpp
 * @brief Unit tests for Rule and perform_rule() (GoogleTest)
 */

#include <gtest/gtest.h>
#include "vetter/Rule.hpp"
#include "vetter/Errors.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace vetter;

namespace {

Rule positive() {
    return Rule("positive", [](const Value& v) {
        return v.is_number() && v.get<double>() > 0;
    });
}

} // anonymous namespace

TEST(Rule, RequiresPredicate) {
    EXPECT_THROW(Rule("broken", Predicate{}), std::invalid_argument);
}

TEST(Rule, Accessors) {
    Rule r = positive();
    EXPECT_EQ(r.description(), "positive");
    EXPECT_TRUE(r.test(3));
    EXPECT_FALSE(r.test(-3));
    EXPECT_FALSE(r.sanitizer().before);
    EXPECT_FALSE(r.sanitizer().after);
}

TEST(PerformRule, PassingValueReturnedUnchanged) {
    PathContext ctx;
    EXPECT_EQ(perform_rule(5, positive(), ctx), 5);
}

TEST(PerformRule, FailingValueRaisesWithDescription) {
    PathContext ctx;
    ctx.push(std::string("count"));
    try {
        perform_rule(-1, positive(), ctx);
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_STREQ(e.what(), "count: requires positive");
    }
}

TEST(PerformRule, BeforeSanitizerRunsBeforeCheck) {
    Sanitizer abs_value;
    abs_value.before = [](const Value& v) -> Value {
        return v.get<int>() < 0 ? -v.get<int>() : v.get<int>();
    };
    Rule r("positive", positive().predicate(), abs_value);

    PathContext ctx;
    EXPECT_EQ(perform_rule(-4, r, ctx), 4);
}

TEST(PerformRule, StepOrder) {
    std::vector<std::string> steps;
    Sanitizer s;
    s.before = [&](const Value& v) { steps.push_back("before"); return v; };
    s.after = [&](const Value& v) { steps.push_back("after"); return v; };
    Rule r("anything", [&](const Value&) { steps.push_back("check"); return true; }, s);

    PathContext ctx;
    perform_rule(1, r, ctx, [&](const Value& v) { steps.push_back("transform"); return v; });

    EXPECT_EQ(steps, (std::vector<std::string>{"before", "check", "transform", "after"}));
}

TEST(PerformRule, AfterSanitizerSeesTransformedValue) {
    Sanitizer s;
    s.after = [](const Value& v) -> Value { return v.get<int>() * 10; };
    Rule r("number", [](const Value& v) { return v.is_number(); }, s);

    PathContext ctx;
    Value out = perform_rule(1, r, ctx, [](const Value& v) -> Value { return v.get<int>() + 1; });
    EXPECT_EQ(out, 20);
}

TEST(PerformRule, TransformSkippedOnFailure) {
    bool transformed = false;
    PathContext ctx;
    EXPECT_THROW(perform_rule(-1, positive(), ctx,
                              [&](const Value& v) { transformed = true; return v; }),
                 ValidationError);
    EXPECT_FALSE(transformed);
}
