#pragma once

#include "domain/states/PaidPayment.hpp"
#include "domain/states/PendingPayment.hpp"
#include "domain/states/RefundedPayment.hpp"
#include "domain/states/VoidPayment.hpp"
#include "domain/value_objects/Timestamp.hpp"

namespace pve::domain {

// Each transition accepts only the state it is legal from and consumes it.
// None of them can fail: the parameter type already is the precondition.

PaidPayment transition_to_paid(PendingPayment&& pending, Timestamp paid_at);
PaidPayment transition_to_paid(PendingPayment&& pending);

VoidPayment transition_to_void(PendingPayment&& pending, Timestamp voided_at);
VoidPayment transition_to_void(PendingPayment&& pending);

RefundedPayment transition_to_refunded(PaidPayment&& paid, Timestamp refunded_at);
RefundedPayment transition_to_refunded(PaidPayment&& paid);

} // namespace pve::domain
