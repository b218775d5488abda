#include "domain/validation/ValidationError.hpp"

#include <gtest/gtest.h>

using namespace pve::domain;

TEST(ValidationError, MakeErrorBuildsRequestedKind) {
    auto error = make_error<ChecksumError>(ValidationRule::Mod10Checksum, "card number",
                                           "card number failed MOD10 (Luhn) checksum");
    EXPECT_TRUE(std::holds_alternative<ChecksumError>(error));
    EXPECT_EQ(field_of(error), "card number");
    EXPECT_EQ(message_of(error), "card number failed MOD10 (Luhn) checksum");
    EXPECT_EQ(rule_of(error), ValidationRule::Mod10Checksum);
}

TEST(ValidationError, KindNameCoversEveryKind) {
    EXPECT_EQ(kind_name(make_error<ShapeError>(ValidationRule::NonDigit, "f", "m")), "ShapeError");
    EXPECT_EQ(kind_name(make_error<RangeError>(ValidationRule::NotPositive, "f", "m")), "RangeError");
    EXPECT_EQ(kind_name(make_error<ChecksumError>(ValidationRule::AbaChecksum, "f", "m")), "ChecksumError");
    EXPECT_EQ(kind_name(make_error<TemporalError>(ValidationRule::PastExpiry, "f", "m")), "TemporalError");
    EXPECT_EQ(kind_name(make_error<CompositionError>(ValidationRule::MissingDigit, "f", "m")),
              "CompositionError");
}

TEST(ValidationError, RuleNames) {
    EXPECT_EQ(rule_name(ValidationRule::NonDigit), "NON_DIGIT");
    EXPECT_EQ(rule_name(ValidationRule::Mod10Checksum), "MOD10_CHECKSUM");
    EXPECT_EQ(rule_name(ValidationRule::RoutingLength), "ROUTING_LENGTH");
    EXPECT_EQ(rule_name(ValidationRule::InvalidMonth), "INVALID_MONTH");
    EXPECT_EQ(rule_name(ValidationRule::PastExpiry), "PAST_EXPIRY");
    EXPECT_EQ(rule_name(ValidationRule::MissingSymbol), "MISSING_SYMBOL");
}

TEST(ValidationError, EqualityIncludesKind) {
    auto shape = make_error<ShapeError>(ValidationRule::NonDigit, "f", "m");
    auto range = make_error<RangeError>(ValidationRule::NonDigit, "f", "m");
    EXPECT_EQ(shape, make_error<ShapeError>(ValidationRule::NonDigit, "f", "m"));
    EXPECT_NE(shape, range);
}
