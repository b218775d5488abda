#include "domain/aggregates/Payment.hpp"

namespace pve::domain {

namespace {

struct StatusOf {
    PaymentStatus operator()(const PendingPayment&) const { return PaymentStatus::PENDING; }
    PaymentStatus operator()(const PaidPayment&) const { return PaymentStatus::PAID; }
    PaymentStatus operator()(const VoidPayment&) const { return PaymentStatus::VOID; }
    PaymentStatus operator()(const RefundedPayment&) const { return PaymentStatus::REFUNDED; }
};

} // anonymous namespace

PaymentStatus payment_status(const Payment& payment) {
    return std::visit(StatusOf{}, payment);
}

std::string_view status_to_string(PaymentStatus status) {
    switch (status) {
        case PaymentStatus::PENDING: return "PENDING";
        case PaymentStatus::PAID: return "PAID";
        case PaymentStatus::VOID: return "VOID";
        case PaymentStatus::REFUNDED: return "REFUNDED";
    }
    return "UNKNOWN";
}

const PositiveAmount& amount_of(const Payment& payment) {
    return std::visit([](const PaymentRecord& p) -> const PositiveAmount& { return p.amount(); },
                      payment);
}

const PaymentMethod& method_of(const Payment& payment) {
    return std::visit([](const PaymentRecord& p) -> const PaymentMethod& { return p.method(); },
                      payment);
}

} // namespace pve::domain
