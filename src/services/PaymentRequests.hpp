#pragma once

#include "domain/value_objects/Decimal.hpp"

#include <string>
#include <variant>

namespace pve::services {

// Unvalidated primitives as received from a caller.

struct CardPaymentRequest {
    std::string card_number;
    int expiry_month = 0;
    int expiry_year = 0;
    std::string cvv;
    pve::domain::Decimal amount = pve::domain::Decimal::zero();
};

struct CheckPaymentRequest {
    std::string routing_number;
    std::string account_number;
    pve::domain::Decimal amount = pve::domain::Decimal::zero();
};

struct CashPaymentRequest {
    pve::domain::Decimal amount = pve::domain::Decimal::zero();
};

struct CredentialsRequest {
    std::string email;
    std::string password;
};

using PaymentRequest =
    std::variant<CardPaymentRequest, CheckPaymentRequest, CashPaymentRequest, CredentialsRequest>;

} // namespace pve::services
