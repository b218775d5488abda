#pragma once

#include "domain/states/PaymentRecord.hpp"

namespace pve::domain {

// Created from validated inputs; awaiting settlement or cancellation.
class PendingPayment : public PaymentRecord {
public:
    PendingPayment(PositiveAmount amount, PaymentMethod method)
        : PaymentRecord(std::move(amount), std::move(method)) {}

    bool operator==(const PendingPayment&) const = default;
};

} // namespace pve::domain
