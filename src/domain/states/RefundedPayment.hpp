#pragma once

#include "domain/states/PaidPayment.hpp"
#include "domain/states/PaymentRecord.hpp"
#include "domain/value_objects/Timestamp.hpp"

namespace pve::domain {

// Settled and then returned to the payer. Terminal.
class RefundedPayment : public PaymentRecord {
public:
    Timestamp refunded_at() const noexcept { return refunded_at_; }

    bool operator==(const RefundedPayment&) const = default;

private:
    RefundedPayment(PaymentRecord record, Timestamp refunded_at)
        : PaymentRecord(std::move(record))
        , refunded_at_(refunded_at) {}

    friend RefundedPayment transition_to_refunded(PaidPayment&& paid, Timestamp refunded_at);

    Timestamp refunded_at_;
};

} // namespace pve::domain
