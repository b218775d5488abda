#include "services/PaymentService.hpp"

#include "domain/validation/ZipOrAccumulate.hpp"

using namespace pve::domain;

namespace pve::services {

namespace {

PendingPayment make_pending(PositiveAmount amount, PaymentMethod method) {
    return PendingPayment(std::move(amount), std::move(method));
}

} // anonymous namespace

PaymentService::PaymentService(const IClock& clock, CardPolicy card_policy)
    : clock_(clock)
    , card_policy_(card_policy) {}

Validated<PendingPayment> PaymentService::authorize(const CardPaymentRequest& request) const {
    return zip_or_accumulate(
        [](PositiveAmount amount, CreditCard card) {
            return make_pending(std::move(amount), std::move(card));
        },
        [&] { return PositiveAmount::validate(request.amount, "amount"); },
        [&] {
            return CreditCard::validate(request.card_number, request.expiry_month,
                                        request.expiry_year, request.cvv,
                                        clock_.current_year_month(), card_policy_);
        });
}

Validated<PendingPayment> PaymentService::authorize(const CheckPaymentRequest& request) const {
    return zip_or_accumulate(
        [](PositiveAmount amount, Check check) {
            return make_pending(std::move(amount), std::move(check));
        },
        [&] { return PositiveAmount::validate(request.amount, "amount"); },
        [&] { return Check::validate(request.routing_number, request.account_number); });
}

Validated<PendingPayment> PaymentService::authorize(const CashPaymentRequest& request) const {
    return zip_or_accumulate(
        [](PositiveAmount amount) { return make_pending(std::move(amount), Cash{}); },
        [&] { return PositiveAmount::validate(request.amount, "amount"); });
}

Validated<PaidPayment> PaymentService::process_card_payment(const CardPaymentRequest& request) const {
    return settle_if_valid(authorize(request));
}

Validated<PaidPayment> PaymentService::process_check_payment(const CheckPaymentRequest& request) const {
    return settle_if_valid(authorize(request));
}

Validated<PaidPayment> PaymentService::process_cash_payment(const CashPaymentRequest& request) const {
    return settle_if_valid(authorize(request));
}

PaidPayment PaymentService::settle(PendingPayment&& pending) const {
    return transition_to_paid(std::move(pending), clock_.now());
}

VoidPayment PaymentService::void_payment(PendingPayment&& pending) const {
    return transition_to_void(std::move(pending), clock_.now());
}

RefundedPayment PaymentService::refund_payment(PaidPayment&& paid) const {
    return transition_to_refunded(std::move(paid), clock_.now());
}

Validated<Credentials> PaymentService::validate_credentials(
    const CredentialsRequest& request, const PasswordPolicy& policy) const {
    return Credentials::validate(request.email, request.password, policy);
}

Validated<PaidPayment> PaymentService::settle_if_valid(Validated<PendingPayment> pending) const {
    if (pending.is_failure()) {
        return Validated<PaidPayment>::failure(std::move(pending).error());
    }
    return Validated<PaidPayment>::success(settle(std::move(pending).value()));
}

} // namespace pve::services
