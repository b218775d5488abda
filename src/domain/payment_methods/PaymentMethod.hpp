#pragma once

#include "domain/payment_methods/Cash.hpp"
#include "domain/payment_methods/Check.hpp"
#include "domain/payment_methods/CreditCard.hpp"

#include <string_view>
#include <variant>

namespace pve::domain {

using PaymentMethod = std::variant<Cash, CreditCard, Check>;

// "CASH", "CREDIT_CARD" or "CHECK"
std::string_view payment_method_type(const PaymentMethod& method);

} // namespace pve::domain
