#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "../canvaschunk/include/canvaschunk/types/result.hpp"

using namespace canvaschunk;

// ============================================================================
// Helper Functions
// ============================================================================

Result<int> parse_positive(int value) {
    if (value <= 0) {
        return Err(Error::Code::InvalidArgument, "not positive");
    }
    return Ok(value);
}

// ============================================================================
// Construction and access
// ============================================================================

TEST(Result, OkHoldsValue) {
    auto r = parse_positive(7);
    ASSERT_TRUE(r.is_ok());
    EXPECT_FALSE(r.is_error());
    EXPECT_TRUE(static_cast<bool>(r));
    EXPECT_EQ(r.value(), 7);
}

TEST(Result, ErrHoldsCodeAndMessage) {
    auto r = parse_positive(-1);
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error().code, Error::Code::InvalidArgument);
    EXPECT_EQ(r.error().message, "not positive");
    EXPECT_TRUE(r.error().is_error());
}

TEST(Result, ValueOrFallsBackOnError) {
    EXPECT_EQ(parse_positive(3).value_or(0), 3);
    EXPECT_EQ(parse_positive(0).value_or(42), 42);
}

TEST(Result, MoveOutValue) {
    Result<std::vector<int>> r = Ok(std::vector<int>{1, 2, 3});
    ASSERT_TRUE(r.is_ok());
    std::vector<int> moved = std::move(r).value();
    EXPECT_EQ(moved.size(), 3u);
}

TEST(Result, VoidResult) {
    Result<void> ok = Ok();
    EXPECT_TRUE(ok.is_ok());

    Result<void> failed = Err(Error::Code::NotConfigured, "missing");
    ASSERT_TRUE(failed.is_error());
    EXPECT_EQ(failed.error().code, Error::Code::NotConfigured);
}

// ============================================================================
// Monadic operations
// ============================================================================

TEST(Result, AndThenChainsOnSuccess) {
    auto r = parse_positive(4).and_then([](int v) { return parse_positive(v - 2); });
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value(), 2);
}

TEST(Result, AndThenPropagatesFirstError) {
    bool called = false;
    auto r = parse_positive(-4).and_then([&](int v) {
        called = true;
        return parse_positive(v);
    });
    ASSERT_TRUE(r.is_error());
    EXPECT_FALSE(called);
}

TEST(Result, TransformMapsValue) {
    auto r = parse_positive(5).transform([](int v) { return std::to_string(v); });
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value(), "5");

    auto e = parse_positive(-5).transform([](int v) { return std::to_string(v); });
    ASSERT_TRUE(e.is_error());
    EXPECT_EQ(e.error().code, Error::Code::InvalidArgument);
}

TEST(Result, OrElseRecovers) {
    auto r = parse_positive(-1).or_else([](const Error&) -> Result<int> { return Ok(1); });
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value(), 1);
}

TEST(Result, CodeNames) {
    EXPECT_STREQ(to_string(Error::Code::DecodeError), "DecodeError");
    EXPECT_STREQ(to_string(Error::Code::OutOfBounds), "OutOfBounds");
    EXPECT_STREQ(to_string(Error::Code::TransportError), "TransportError");
}
