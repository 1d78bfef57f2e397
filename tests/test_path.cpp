/**
 * @file test_path.cpp
 * @brief Unit tests for path tracking (GoogleTest)
 */

#include <gtest/gtest.h>
#include "vetter/Path.hpp"
#include "vetter/Errors.hpp"

#include <stdexcept>

using namespace vetter;

// ============================================================================
// render()
// ============================================================================

TEST(PathRender, EmptyIsEmptyString) {
    PathContext ctx;
    EXPECT_EQ(ctx.render(), "");
}

TEST(PathRender, FirstNameUnprefixed) {
    PathContext ctx;
    ctx.push(std::string("root"));
    EXPECT_EQ(ctx.render(), "root");
}

TEST(PathRender, NamesJoinedWithDots) {
    PathContext ctx;
    ctx.push(std::string("root"));
    ctx.push(std::string("user"));
    ctx.push(std::string("name"));
    EXPECT_EQ(ctx.render(), "root.user.name");
}

TEST(PathRender, IndexAtRoot) {
    PathContext ctx;
    ctx.push(std::size_t{0});
    EXPECT_EQ(ctx.render(), "[0]");
}

TEST(PathRender, MixedSegments) {
    PathContext ctx;
    ctx.push(std::string("items"));
    ctx.push(std::size_t{2});
    ctx.push(std::string("id"));
    EXPECT_EQ(ctx.render(), "items[2].id");
}

TEST(PathRender, NameAfterLeadingIndex) {
    PathContext ctx;
    ctx.push(std::size_t{3});
    ctx.push(std::string("tags"));
    ctx.push(std::size_t{1});
    EXPECT_EQ(ctx.render(), "[3].tags[1]");
}

// ============================================================================
// push / pop balance
// ============================================================================

TEST(PathContext, PopOnEmptyThrows) {
    PathContext ctx;
    EXPECT_THROW(ctx.pop(), std::logic_error);
}

TEST(ScopedSegment, PopsOnScopeExit) {
    PathContext ctx;
    {
        ScopedSegment seg(ctx, std::string("a"));
        EXPECT_EQ(ctx.size(), 1u);
        {
            ScopedSegment inner(ctx, std::size_t{4});
            EXPECT_EQ(ctx.render(), "a[4]");
        }
        EXPECT_EQ(ctx.size(), 1u);
    }
    EXPECT_TRUE(ctx.empty());
}

TEST(ScopedSegment, PopsWhenUnwinding) {
    PathContext ctx;
    ctx.push(std::string("outer"));
    try {
        ScopedSegment seg(ctx, std::string("inner"));
        throw std::runtime_error("boom");
    } catch (const std::runtime_error&) {
    }
    EXPECT_EQ(ctx.size(), 1u);
    EXPECT_EQ(ctx.render(), "outer");
}

// ============================================================================
// raise_error()
// ============================================================================

TEST(RaiseError, DefaultPrefix) {
    PathContext ctx;
    ctx.push(std::string("user"));
    ctx.push(std::string("age"));
    try {
        raise_error(ctx, "integer");
        FAIL() << "raise_error returned";
    } catch (const ValidationError& e) {
        EXPECT_STREQ(e.what(), "user.age: requires integer");
        EXPECT_EQ(e.path(), "user.age");
        EXPECT_EQ(e.prefix(), "requires");
        EXPECT_EQ(e.description(), "integer");
    }
}

TEST(RaiseError, CustomPrefix) {
    PathContext ctx;
    ctx.push(std::string("b"));
    try {
        raise_error(ctx, "'b'", kUnknownPropertyPrefix);
        FAIL() << "raise_error returned";
    } catch (const ValidationError& e) {
        EXPECT_STREQ(e.what(), "b: unknown property 'b'");
    }
}

TEST(RaiseError, EmptyPath) {
    PathContext ctx;
    try {
        raise_error(ctx, "positive");
        FAIL() << "raise_error returned";
    } catch (const ValidationError& e) {
        EXPECT_STREQ(e.what(), ": requires positive");
        EXPECT_EQ(e.path(), "");
    }
}

TEST(RaiseError, IsVetterError) {
    PathContext ctx;
    EXPECT_THROW(raise_error(ctx, "x"), VetterError);
}
