#include "domain/payment_methods/Check.hpp"

#include <gtest/gtest.h>

using namespace pve::domain;

TEST(Check, AcceptsValidCheck) {
    auto r = Check::validate("021000021", "0001234567");
    ASSERT_TRUE(r.is_success());
    EXPECT_EQ(r.value().routing_number().value(), "021000021");
    EXPECT_EQ(r.value().account_number().value(), "0001234567");
    EXPECT_EQ(r.value().account_last4(), "4567");
}

TEST(Check, ShortAccountNumberLast4IsWholeNumber) {
    EXPECT_EQ(Check::validate("021000021", "12").value().account_last4(), "12");
}

TEST(Check, ReportsRoutingAndAccountTogether) {
    auto r = Check::validate("021000022", "12-34");
    ASSERT_TRUE(r.is_failure());
    ASSERT_EQ(r.error().size(), 2u);
    EXPECT_EQ(rule_of(r.error()[0]), ValidationRule::AbaChecksum);
    EXPECT_EQ(field_of(r.error()[1]), "account number");
}
