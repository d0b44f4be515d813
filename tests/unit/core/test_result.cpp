//
// Created by gregorian-rayne on 10/06/26.
//

#include <gtest/gtest.h>
#include "cga/result.hpp"

#include <stdexcept>
#include <string>

using namespace cga;

TEST(ResultTest, Success_HoldsValue) {
    const auto result = Result<int>::success(42);

    EXPECT_TRUE(result.is_ok());
    EXPECT_FALSE(result.is_err());
    EXPECT_TRUE(static_cast<bool>(result));
    EXPECT_EQ(result.value(), 42);
}

TEST(ResultTest, Failure_HoldsError) {
    const auto result = Result<int>::failure(Error::not_found("missing"));

    EXPECT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::NotFound);
    EXPECT_EQ(result.value_or(7), 7);
}

TEST(ResultTest, Value_ThrowsOnError) {
    const auto result = Result<int>::failure(Error::internal_error("boom"));
    EXPECT_THROW((void)result.value(), std::logic_error);
}

TEST(ResultTest, Error_ThrowsOnSuccess) {
    const auto result = Result<int>::success(1);
    EXPECT_THROW((void)result.error(), std::logic_error);
}

TEST(ResultTest, Map_TransformsValue) {
    const auto result = Result<int>::success(21).map([](const int v) { return v * 2; });
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), 42);
}

TEST(ResultTest, Map_PropagatesError) {
    const auto result = Result<int>::failure(Error::parse_error("bad"))
        .map([](const int v) { return std::to_string(v); });
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().message(), "bad");
}

TEST(ResultTest, AndThen_Chains) {
    auto half = [](const int v) {
        if (v % 2 != 0) {
            return Result<int>::failure(Error::invalid_argument("odd"));
        }
        return Result<int>::success(v / 2);
    };

    EXPECT_EQ(Result<int>::success(8).and_then(half).value(), 4);
    EXPECT_TRUE(Result<int>::success(3).and_then(half).is_err());
}

TEST(ResultTest, Void_SuccessAndFailure) {
    const auto ok = Result<void>::success();
    EXPECT_TRUE(ok.is_ok());

    const auto err = Result<void>::failure(Error::config_error("bad"));
    ASSERT_TRUE(err.is_err());
    EXPECT_EQ(err.error().code(), ErrorCode::ConfigError);
}
