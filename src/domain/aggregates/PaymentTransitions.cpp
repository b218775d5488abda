#include "domain/aggregates/PaymentTransitions.hpp"

#include <utility>

namespace pve::domain {

PaidPayment transition_to_paid(PendingPayment&& pending, Timestamp paid_at) {
    return PaidPayment(static_cast<PaymentRecord&&>(pending), paid_at);
}

PaidPayment transition_to_paid(PendingPayment&& pending) {
    return transition_to_paid(std::move(pending), Timestamp::now());
}

VoidPayment transition_to_void(PendingPayment&& pending, Timestamp voided_at) {
    return VoidPayment(static_cast<PaymentRecord&&>(pending), voided_at);
}

VoidPayment transition_to_void(PendingPayment&& pending) {
    return transition_to_void(std::move(pending), Timestamp::now());
}

RefundedPayment transition_to_refunded(PaidPayment&& paid, Timestamp refunded_at) {
    return RefundedPayment(static_cast<PaymentRecord&&>(paid), refunded_at);
}

RefundedPayment transition_to_refunded(PaidPayment&& paid) {
    return transition_to_refunded(std::move(paid), Timestamp::now());
}

} // namespace pve::domain
