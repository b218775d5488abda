#include "domain/value_objects/RoutingNumber.hpp"

#include <gtest/gtest.h>

using namespace pve::domain;

TEST(RoutingNumber, AcceptsValidRoutingNumber) {
    auto r = RoutingNumber::validate("021000021", "routing number");
    ASSERT_TRUE(r.is_success());
    EXPECT_EQ(r.value().value(), "021000021");
}

TEST(RoutingNumber, RejectsBadCheckDigit) {
    auto r = RoutingNumber::validate("021000022", "routing number");
    ASSERT_TRUE(r.is_failure());
    ASSERT_EQ(r.error().size(), 1u);
    EXPECT_TRUE(std::holds_alternative<ChecksumError>(r.error().head()));
    EXPECT_EQ(message_of(r.error().head()), "routing number failed ABA routing checksum");
}

TEST(RoutingNumber, WrongLengthSkipsChecksum) {
    auto r = RoutingNumber::validate("02100002", "routing number");
    ASSERT_TRUE(r.is_failure());
    ASSERT_EQ(r.error().size(), 1u);
    EXPECT_EQ(rule_of(r.error().head()), ValidationRule::RoutingLength);
    EXPECT_EQ(message_of(r.error().head()), "routing number must be exactly 9 digits long");
}

TEST(RoutingNumber, ReportsNonDigitAndLengthTogether) {
    auto r = RoutingNumber::validate("02100x", "routing number");
    ASSERT_TRUE(r.is_failure());
    ASSERT_EQ(r.error().size(), 2u);
    EXPECT_EQ(rule_of(r.error()[0]), ValidationRule::NonDigit);
    EXPECT_EQ(rule_of(r.error()[1]), ValidationRule::RoutingLength);
}

TEST(RoutingNumber, SpacesAreNormalizedAway) {
    auto r = RoutingNumber::validate(" 021 000 021 ", "routing number");
    ASSERT_TRUE(r.is_success());
    EXPECT_EQ(r.value().value(), "021000021");
}

TEST(RoutingNumber, RevalidatingValueIsIdempotent) {
    auto first = RoutingNumber::validate(" 021 000 021", "routing number").value();
    EXPECT_EQ(RoutingNumber::validate(first.value(), "routing number").value(), first);
}
