#include "domain/aggregates/Payment.hpp"

#include <gtest/gtest.h>

using namespace pve::domain;

namespace {

PositiveAmount amount(const std::string& text) {
    return PositiveAmount::validate(Decimal::from_string(text), "amount").value();
}

} // namespace

TEST(Payment, StatusFollowsState) {
    Payment pending = PendingPayment(amount("10"), Cash{});
    EXPECT_EQ(payment_status(pending), PaymentStatus::PENDING);

    Payment paid = transition_to_paid(PendingPayment(amount("10"), Cash{}), Timestamp(1));
    EXPECT_EQ(payment_status(paid), PaymentStatus::PAID);

    Payment voided = transition_to_void(PendingPayment(amount("10"), Cash{}), Timestamp(1));
    EXPECT_EQ(payment_status(voided), PaymentStatus::VOID);

    Payment refunded = transition_to_refunded(
        transition_to_paid(PendingPayment(amount("10"), Cash{}), Timestamp(1)), Timestamp(2));
    EXPECT_EQ(payment_status(refunded), PaymentStatus::REFUNDED);
}

TEST(Payment, StatusNames) {
    EXPECT_EQ(status_to_string(PaymentStatus::PENDING), "PENDING");
    EXPECT_EQ(status_to_string(PaymentStatus::PAID), "PAID");
    EXPECT_EQ(status_to_string(PaymentStatus::VOID), "VOID");
    EXPECT_EQ(status_to_string(PaymentStatus::REFUNDED), "REFUNDED");
}

TEST(Payment, SharedFieldsAreReachableFromAnyState) {
    Payment voided = transition_to_void(PendingPayment(amount("42.50"), Cash{}), Timestamp(1));
    EXPECT_EQ(amount_of(voided).value().to_string(), "42.50");
    EXPECT_EQ(method_of(voided), PaymentMethod{Cash{}});
}
