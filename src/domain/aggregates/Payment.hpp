#pragma once

#include "domain/aggregates/PaymentTransitions.hpp"
#include "domain/payment_methods/PaymentMethod.hpp"
#include "domain/states/PaidPayment.hpp"
#include "domain/states/PendingPayment.hpp"
#include "domain/states/RefundedPayment.hpp"
#include "domain/states/VoidPayment.hpp"
#include "domain/value_objects/PositiveAmount.hpp"

#include <string_view>
#include <variant>

namespace pve::domain {

// A payment is always exactly one of these states.
using Payment = std::variant<PendingPayment, PaidPayment, VoidPayment, RefundedPayment>;

enum class PaymentStatus { PENDING, PAID, VOID, REFUNDED };

PaymentStatus payment_status(const Payment& payment);
std::string_view status_to_string(PaymentStatus status);

const PositiveAmount& amount_of(const Payment& payment);
const PaymentMethod& method_of(const Payment& payment);

} // namespace pve::domain
