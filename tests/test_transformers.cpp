/**
 * @file test_transformers.cpp
 * @brief Unit tests for the container transformers (GoogleTest)
 */

#include <gtest/gtest.h>
#include "vetter/Transformers.hpp"
#include "vetter/Rules.hpp"
#include "vetter/Errors.hpp"

#include <string>
#include <vector>

using namespace vetter;

// ============================================================================
// Non-container passthrough
// ============================================================================

class PassthroughTest : public ::testing::Test {
protected:
    ObjectTransformer object{ObjectSchema{{"a", rules::string()}}};
    ArrayTransformer array{PropertyRule(rules::string())};
    IndexedObjectTransformer map{PropertyRule(rules::string())};
    PathContext ctx;
};

TEST_F(PassthroughTest, NullUnchanged) {
    EXPECT_TRUE(object.process(nullptr, ctx).is_null());
    EXPECT_TRUE(array.process(nullptr, ctx).is_null());
    EXPECT_TRUE(map.process(nullptr, ctx).is_null());
}

TEST_F(PassthroughTest, UndefinedUnchanged) {
    EXPECT_TRUE(is_undefined(object.process(undefined(), ctx)));
    EXPECT_TRUE(is_undefined(array.process(undefined(), ctx)));
    EXPECT_TRUE(is_undefined(map.process(undefined(), ctx)));
}

TEST_F(PassthroughTest, ScalarsUnchanged) {
    EXPECT_EQ(object.process(7, ctx), 7);
    EXPECT_EQ(array.process("s", ctx), "s");
    EXPECT_EQ(map.process(true, ctx), true);
}

TEST_F(PassthroughTest, WrongContainerUnchanged) {
    Value arr = {1, 2};
    EXPECT_EQ(object.process(arr, ctx), arr);
    EXPECT_EQ(map.process(arr, ctx), arr);
    EXPECT_EQ(array.process(Value::object(), ctx), Value::object());
}

// ============================================================================
// ObjectTransformer
// ============================================================================

TEST(ObjectTransformer, UnknownKeyBeforeDeclaredKeys) {
    int checked = 0;
    Rule counting("anything", [&](const Value&) { ++checked; return true; });
    ObjectTransformer t(ObjectSchema{{"a", counting}, {"b", counting}});

    PathContext ctx;
    EXPECT_THROW(t.process(Value{{"a", 1}, {"b", 2}, {"c", 3}}, ctx), ValidationError);
    EXPECT_EQ(checked, 0);
    EXPECT_TRUE(ctx.empty());
}

TEST(ObjectTransformer, SmallestUnknownKeyReported) {
    ObjectTransformer t(ObjectSchema{{"m", rules::any()}});
    PathContext ctx;
    ctx.push(std::string("cfg"));
    try {
        t.process(Value{{"zeta", 1}, {"alpha", 2}, {"m", 3}}, ctx);
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_STREQ(e.what(), "cfg.alpha: unknown property 'alpha'");
        EXPECT_EQ(e.description(), "'alpha'");
    }
    EXPECT_EQ(ctx.size(), 1u);
}

TEST(ObjectTransformer, DeclarationOrderProcessing) {
    std::vector<std::string> seen;
    auto recording = [&](const std::string& name) {
        return Rule(name, [&seen, name](const Value&) { seen.push_back(name); return true; });
    };
    ObjectSchema schema;
    schema.add("second", recording("second")).add("first", recording("first"));
    ObjectTransformer t(schema);

    PathContext ctx;
    t.process(Value{{"first", 1}, {"second", 2}}, ctx);
    EXPECT_EQ(seen, (std::vector<std::string>{"second", "first"}));
}

TEST(ObjectTransformer, DropsUndefinedResults) {
    ObjectTransformer t(ObjectSchema{{"a", rules::any()}, {"b", rules::any()}});
    PathContext ctx;
    Value out = t.process(Value{{"a", 1}}, ctx);
    EXPECT_EQ(out, (Value{{"a", 1}}));
}

TEST(ObjectTransformer, InputNotModified) {
    ObjectTransformer t(ObjectSchema{{"name", rules::with_sanitizer(rules::string(),
                                                                    Sanitizer{rules::trim(), {}})}});
    PathContext ctx;
    Value input = {{"name", "  x  "}};
    Value out = t.process(input, ctx);
    EXPECT_EQ(out["name"], "x");
    EXPECT_EQ(input["name"], "  x  ");
}

// ============================================================================
// ArrayTransformer
// ============================================================================

TEST(ArrayTransformer, PreservesOrder) {
    ArrayTransformer t(PropertyRule(Transform([](const Value& v) -> Value {
        return v.get<int>() * 2;
    })));
    PathContext ctx;
    EXPECT_EQ(t.process(Value{3, 1, 2}, ctx), (Value{6, 2, 4}));
}

TEST(ArrayTransformer, EmptyArray) {
    ArrayTransformer t(PropertyRule(rules::string()));
    PathContext ctx;
    Value out = t.process(Value::array(), ctx);
    EXPECT_TRUE(out.is_array());
    EXPECT_TRUE(out.empty());
}

TEST(ArrayTransformer, UndefinedElementBecomesNull) {
    ArrayTransformer t(PropertyRule(Transform([](const Value&) { return undefined(); })));
    PathContext ctx;
    Value out = t.process(Value{1, 2}, ctx);
    EXPECT_EQ(out, (Value{nullptr, nullptr}));
}

TEST(ArrayTransformer, IndexPushedForNestedFailure) {
    ArrayTransformer t(PropertyRule(Validator::object({{"id", rules::integer()}})));
    PathContext ctx;
    try {
        t.process(Value{Value{{"id", 1}}, Value{{"id", "two"}}}, ctx);
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.path(), "[1].id");
    }
    EXPECT_TRUE(ctx.empty());
}

// ============================================================================
// IndexedObjectTransformer
// ============================================================================

TEST(IndexedObjectTransformer, NoUnknownKeyRestriction) {
    IndexedObjectTransformer t(PropertyRule(rules::number()));
    PathContext ctx;
    Value input = {{"a", 1}, {"b", 2.5}, {"c", -3}};
    EXPECT_EQ(t.process(input, ctx), input);
}

TEST(IndexedObjectTransformer, EmptyObject) {
    IndexedObjectTransformer t(PropertyRule(rules::number()));
    PathContext ctx;
    Value out = t.process(Value::object(), ctx);
    EXPECT_TRUE(out.is_object());
    EXPECT_TRUE(out.empty());
}

TEST(IndexedObjectTransformer, SanitizesEachValue) {
    IndexedObjectTransformer t(PropertyRule(Transform(rules::lower())));
    PathContext ctx;
    EXPECT_EQ(t.process(Value{{"k", "ABC"}}, ctx), (Value{{"k", "abc"}}));
}
