#include "domain/value_objects/NonNegativeNumber.hpp"
#include "domain/value_objects/PositiveNumber.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

using namespace pve::domain;

// --- PositiveNumber ---

TEST(PositiveNumber, AcceptsPositiveValues) {
    EXPECT_EQ(PositiveNumber<int>::validate(1, "count").value().value(), 1);
    EXPECT_DOUBLE_EQ(PositiveNumber<double>::validate(0.01, "rate").value().value(), 0.01);
}

TEST(PositiveNumber, RejectsZeroAndNegative) {
    auto zero = PositiveNumber<int>::validate(0, "count");
    ASSERT_TRUE(zero.is_failure());
    EXPECT_TRUE(std::holds_alternative<RangeError>(zero.error()));
    EXPECT_EQ(message_of(zero.error()), "count must be a positive number (> 0)");

    EXPECT_TRUE(PositiveNumber<long>::validate(-5, "count").is_failure());
}

TEST(PositiveNumber, RejectsNaN) {
    EXPECT_TRUE(PositiveNumber<double>::validate(std::nan(""), "rate").is_failure());
}

TEST(PositiveNumber, OrdersByValue) {
    auto a = PositiveNumber<int>::validate(1, "n").value();
    auto b = PositiveNumber<int>::validate(2, "n").value();
    EXPECT_LT(a, b);
}

// --- NonNegativeNumber ---

TEST(NonNegativeNumber, AcceptsZero) {
    EXPECT_EQ(NonNegativeNumber<int>::validate(0, "balance").value().value(), 0);
}

TEST(NonNegativeNumber, RejectsNegative) {
    auto r = NonNegativeNumber<double>::validate(-0.5, "balance");
    ASSERT_TRUE(r.is_failure());
    EXPECT_EQ(rule_of(r.error()), ValidationRule::Negative);
    EXPECT_EQ(message_of(r.error()), "balance must be a non-negative number (>= 0)");
}

TEST(NonNegativeNumber, RejectsNaN) {
    auto nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_TRUE(NonNegativeNumber<double>::validate(nan, "balance").is_failure());
}
