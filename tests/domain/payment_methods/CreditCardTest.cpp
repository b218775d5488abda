#include "domain/payment_methods/CreditCard.hpp"

#include <gtest/gtest.h>

using namespace pve::domain;
using namespace std::chrono;

namespace {

constexpr year_month august_2024 = 2024y / August;

} // namespace

TEST(CreditCard, AcceptsValidCard) {
    auto r = CreditCard::validate("4532 0151 1283 0366", 12, 2026, "123", august_2024);
    ASSERT_TRUE(r.is_success());
    const auto& card = r.value();
    EXPECT_EQ(card.number().value(), "4532015112830366");
    EXPECT_EQ(card.expiry().to_string(), "2026-12");
    EXPECT_EQ(card.cvv().value(), "123");
    EXPECT_EQ(card.last4(), "0366");
}

TEST(CreditCard, ReportsEveryInvalidFieldInOrder) {
    auto r = CreditCard::validate("4532015112830367", 13, 2025, "12a", august_2024);
    ASSERT_TRUE(r.is_failure());
    ASSERT_EQ(r.error().size(), 3u);

    EXPECT_TRUE(std::holds_alternative<ChecksumError>(r.error()[0]));
    EXPECT_EQ(field_of(r.error()[0]), "card number");
    EXPECT_EQ(rule_of(r.error()[1]), ValidationRule::InvalidMonth);
    EXPECT_EQ(field_of(r.error()[1]), "expiry date");
    EXPECT_EQ(rule_of(r.error()[2]), ValidationRule::NonDigit);
    EXPECT_EQ(field_of(r.error()[2]), "CVV");
}

TEST(CreditCard, SingleBadFieldFailsWholeCard) {
    auto r = CreditCard::validate("4532015112830366", 12, 2026, "12345", august_2024);
    ASSERT_TRUE(r.is_failure());
    ASSERT_EQ(r.error().size(), 1u);
    EXPECT_EQ(rule_of(r.error().head()), ValidationRule::ExceedsMaxLength);
}

TEST(CreditCard, ExpiredCardIsTemporalError) {
    auto r = CreditCard::validate("4532015112830366", 7, 2024, "123", august_2024);
    ASSERT_TRUE(r.is_failure());
    EXPECT_TRUE(std::holds_alternative<TemporalError>(r.error().head()));
}

TEST(CreditCard, PolicyControlsLengths) {
    CardPolicy strict;
    strict.cvv_min_length = 4;
    auto r = CreditCard::validate("4532015112830366", 12, 2026, "123", august_2024, strict);
    ASSERT_TRUE(r.is_failure());
    EXPECT_EQ(message_of(r.error().head()), "CVV must be at least 4 digits");
}

TEST(CreditCard, CreateRecordsIntoAccumulator) {
    ErrorAccumulator errors;
    auto card = CreditCard::create(errors, "", 0, 2020, "", august_2024);
    EXPECT_FALSE(card.has_value());
    // card number shape, month, past date, CVV empty, CVV too short
    EXPECT_EQ(errors.error_count(), 5u);
}
