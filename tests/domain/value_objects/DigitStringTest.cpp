#include "domain/value_objects/DigitString.hpp"

#include <gtest/gtest.h>

using namespace pve::domain;

TEST(DigitString, AcceptsDigits) {
    auto r = DigitString::validate("000123456789", "account number");
    ASSERT_TRUE(r.is_success());
    EXPECT_EQ(r.value().value(), "000123456789");
}

TEST(DigitString, SpacesAreNormalizedAway) {
    auto spaced = DigitString::validate(" 123 456 ", "account number");
    auto plain = DigitString::validate("123456", "account number");
    EXPECT_EQ(spaced, plain);
}

TEST(DigitString, EmptyIsNonDigit) {
    auto r = DigitString::validate("   ", "CVV");
    ASSERT_TRUE(r.is_failure());
    ASSERT_EQ(r.error().size(), 1u);
    EXPECT_EQ(rule_of(r.error().head()), ValidationRule::NonDigit);
    EXPECT_EQ(message_of(r.error().head()), "CVV must contain only digits (spaces allowed)");
}

TEST(DigitString, ReportsEveryShapeProblem) {
    auto r = DigitString::validate("1a", "CVV", LengthBounds::between(3, 4));
    ASSERT_TRUE(r.is_failure());
    ASSERT_EQ(r.error().size(), 2u);
    EXPECT_EQ(rule_of(r.error()[0]), ValidationRule::NonDigit);
    EXPECT_EQ(rule_of(r.error()[1]), ValidationRule::BelowMinLength);
}

TEST(DigitString, MaxLengthIsInclusive) {
    EXPECT_TRUE(DigitString::validate("1234", "CVV", LengthBounds::at_most(4)).is_success());
    EXPECT_TRUE(DigitString::validate("12345", "CVV", LengthBounds::at_most(4)).is_failure());
}

TEST(DigitString, RevalidatingValueIsIdempotent) {
    auto first = DigitString::validate("12 34", "n").value();
    EXPECT_EQ(DigitString::validate(first.value(), "n").value(), first);
}
