#pragma once

#include "domain/payment_methods/PaymentMethod.hpp"
#include "domain/value_objects/PositiveAmount.hpp"

#include <utility>

namespace pve::domain {

// Fields shared by every payment state.
class PaymentRecord {
public:
    const PositiveAmount& amount() const noexcept { return amount_; }
    const PaymentMethod& method() const noexcept { return method_; }

    bool operator==(const PaymentRecord&) const = default;

protected:
    PaymentRecord(PositiveAmount amount, PaymentMethod method)
        : amount_(std::move(amount))
        , method_(std::move(method)) {}

private:
    PositiveAmount amount_;
    PaymentMethod method_;
};

} // namespace pve::domain
