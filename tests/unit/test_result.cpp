/**
 * @file test_result.cpp
 * @brief Unit tests for Result<T, E> monadic error type.
 */

#include "core/result.hpp"

#include <gtest/gtest.h>
#include <utility>

using namespace tool_chain;

TEST(ResultTest, SuccessValue) {
    Result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, 42);
}

TEST(ResultTest, ErrorValue) {
    Result<int> r = Error{"something went wrong"};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().message, "something went wrong");
    EXPECT_EQ(r.error().code, ErrorCode::Internal);
}

TEST(ResultTest, BoolConversion) {
    Result<int> success = 1;
    Result<int> failure = Error{"fail"};
    EXPECT_TRUE(static_cast<bool>(success));
    EXPECT_FALSE(static_cast<bool>(failure));
}

TEST(ResultTest, ValueOr) {
    Result<int> success = 42;
    Result<int> failure = Error{"fail"};
    EXPECT_EQ(success.value_or(0), 42);
    EXPECT_EQ(failure.value_or(0), 0);
}

TEST(ResultTest, Map) {
    Result<int> r = 21;
    auto doubled = r.map([](int v) { return v * 2; });
    ASSERT_TRUE(doubled.has_value());
    EXPECT_EQ(*doubled, 42);
}

TEST(ResultTest, MapOnErrorKeepsCode) {
    Result<int> r = Error{ErrorCode::ItemNotFound, "missing"};
    auto doubled = r.map([](int v) { return v * 2; });
    ASSERT_FALSE(doubled.has_value());
    EXPECT_EQ(doubled.error().code, ErrorCode::ItemNotFound);
    EXPECT_EQ(doubled.error().message, "missing");
}

TEST(ResultTest, AndThen) {
    Result<int> r = 4;
    auto checked = r.and_then([](int v) -> Result<int> {
        if (v > 3) return Error{ErrorCode::InvalidConfig, "too large"};
        return v;
    });
    ASSERT_FALSE(checked.has_value());
    EXPECT_EQ(checked.error().code, ErrorCode::InvalidConfig);
}

TEST(ResultTest, ValueOnErrorThrows) {
    Result<int> r = Error{"fail"};
    EXPECT_THROW(static_cast<void>(r.value()), std::runtime_error);
}

TEST(ResultTest, MapErrorRewritesMessage) {
    Result<int> failure = Error{ErrorCode::InvalidConfig, "bad file"};
    auto prefixed = std::move(failure).map_error([](Error e) {
        e.message = "catalog: " + e.message;
        return e;
    });
    ASSERT_FALSE(prefixed.has_value());
    EXPECT_EQ(prefixed.error().code, ErrorCode::InvalidConfig);
    EXPECT_EQ(prefixed.error().message, "catalog: bad file");

    Result<int> success = 7;
    auto untouched = std::move(success).map_error([](Error e) { return e; });
    EXPECT_EQ(*untouched, 7);
}

TEST(ResultTest, VoidSuccessAndError) {
    Result<void> ok;
    Result<void> failed = Error{ErrorCode::DuplicateName, "taken"};
    EXPECT_TRUE(ok.has_value());
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code, ErrorCode::DuplicateName);
}

TEST(ResultTest, MakeError) {
    auto r = make_error<std::string>(ErrorCode::CircularDependency, "loop");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::CircularDependency);
}

// ─── Error classification ────────────────────

TEST(ErrorTest, TransientCarriesCondition) {
    auto err = Error::transient("timeout", "slow");
    EXPECT_TRUE(err.is_transient());
    EXPECT_EQ(err.code, ErrorCode::Transient);
    EXPECT_EQ(err.condition, "timeout");
    EXPECT_EQ(err.what(), "slow");
}

TEST(ErrorTest, PermanentIsNotTransient) {
    auto err = Error::permanent("bad input");
    EXPECT_FALSE(err.is_transient());
    EXPECT_EQ(err.code, ErrorCode::Permanent);
    EXPECT_TRUE(err.condition.empty());
}

TEST(ErrorTest, CodeNames) {
    EXPECT_EQ(to_string(ErrorCode::ItemNotFound), "item_not_found");
    EXPECT_EQ(to_string(ErrorCode::CircularDependency), "circular_dependency");
    EXPECT_EQ(to_string(ErrorCode::Transient), "transient");
}
