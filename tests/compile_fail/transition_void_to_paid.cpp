// Must fail to compile: a voided payment can never be settled.
#include "domain/aggregates/PaymentTransitions.hpp"

#include <utility>

namespace pve::domain {

PaidPayment settle_voided(VoidPayment&& voided) {
    return transition_to_paid(std::move(voided), Timestamp(0));
}

} // namespace pve::domain
