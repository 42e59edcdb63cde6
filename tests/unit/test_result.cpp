/**
 * @file test_result.cpp
 * @brief Unit tests for Result<T, E> and the error taxonomy.
 */

#include "core/result.hpp"

#include <gtest/gtest.h>

using namespace agent_orchestrator;

TEST(ResultTest, SuccessValue) {
    Result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, 42);
}

TEST(ResultTest, ErrorValue) {
    Result<int> r = Error{ErrorKind::Io, "something went wrong"};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().message, "something went wrong");
    EXPECT_EQ(r.error().kind, ErrorKind::Io);
}

TEST(ResultTest, MessageOnlyErrorIsInternal) {
    Error e{"fail"};
    EXPECT_EQ(e.kind, ErrorKind::Internal);
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

TEST(ResultTest, MapOnErrorKeepsKind) {
    Result<int> r = Error{ErrorKind::DependencyCycle, "fail"};
    auto doubled = r.map([](int v) { return v * 2; });
    ASSERT_FALSE(doubled.has_value());
    EXPECT_EQ(doubled.error().message, "fail");
    EXPECT_EQ(doubled.error().kind, ErrorKind::DependencyCycle);
}

TEST(ResultTest, AndThenShortCircuits) {
    int calls = 0;
    Result<int> failure = Error{ErrorKind::Config, "bad"};
    auto chained = failure.and_then([&](int v) -> Result<int> { ++calls; return v + 1; });
    EXPECT_FALSE(chained.has_value());
    EXPECT_EQ(calls, 0);
}

TEST(ResultTest, ValueOnErrorThrows) {
    Result<int> failure = Error{"fail"};
    EXPECT_THROW((void)failure.value(), std::runtime_error);
}

TEST(ResultTest, VoidResult) {
    Result<void> ok;
    Result<void> bad = Error{ErrorKind::PhaseLockHeld, "held"};
    EXPECT_TRUE(ok.has_value());
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().kind, ErrorKind::PhaseLockHeld);
}

TEST(ErrorTest, DescribePrefixesKindName) {
    Error e{ErrorKind::WorkspaceConflict, "path taken"};
    EXPECT_EQ(e.describe(), "WorkspaceConflictError: path taken");
    EXPECT_EQ(to_string(ErrorKind::EscalationExhausted), "EscalationExhausted");
}

TEST(ErrorTest, MakeError) {
    auto r = make_error<int>(ErrorKind::ProcessLaunch, "no such runner");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().describe(), "ProcessLaunchError: no such runner");
}
