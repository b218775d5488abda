#pragma once

#include "domain/states/PaymentRecord.hpp"
#include "domain/states/PendingPayment.hpp"
#include "domain/value_objects/Timestamp.hpp"

namespace pve::domain {

// Cancelled before settlement. Terminal.
class VoidPayment : public PaymentRecord {
public:
    Timestamp voided_at() const noexcept { return voided_at_; }

    bool operator==(const VoidPayment&) const = default;

private:
    VoidPayment(PaymentRecord record, Timestamp voided_at)
        : PaymentRecord(std::move(record))
        , voided_at_(voided_at) {}

    friend VoidPayment transition_to_void(PendingPayment&& pending, Timestamp voided_at);

    Timestamp voided_at_;
};

} // namespace pve::domain
