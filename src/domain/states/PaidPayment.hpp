#pragma once

#include "domain/states/PaymentRecord.hpp"
#include "domain/states/PendingPayment.hpp"
#include "domain/value_objects/Timestamp.hpp"

namespace pve::domain {

class PaidPayment : public PaymentRecord {
public:
    Timestamp paid_at() const noexcept { return paid_at_; }

    bool operator==(const PaidPayment&) const = default;

private:
    PaidPayment(PaymentRecord record, Timestamp paid_at)
        : PaymentRecord(std::move(record))
        , paid_at_(paid_at) {}

    friend PaidPayment transition_to_paid(PendingPayment&& pending, Timestamp paid_at);

    Timestamp paid_at_;
};

} // namespace pve::domain
