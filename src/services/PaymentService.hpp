#pragma once

#include "domain/accounts/Credentials.hpp"
#include "domain/aggregates/Payment.hpp"
#include "domain/payment_methods/CreditCard.hpp"
#include "domain/validation/Result.hpp"
#include "domain/value_objects/StrongPassword.hpp"
#include "services/IClock.hpp"
#include "services/PaymentRequests.hpp"

namespace pve::services {

// Turns raw payment requests into payment states. The amount and the
// payment method are validated together, so one call reports every problem.
class PaymentService {
public:
    explicit PaymentService(const IClock& clock,
                            pve::domain::CardPolicy card_policy = pve::domain::CardPolicy{});

    // Validation only: the payment is left pending.
    pve::domain::Validated<pve::domain::PendingPayment> authorize(const CardPaymentRequest& request) const;
    pve::domain::Validated<pve::domain::PendingPayment> authorize(const CheckPaymentRequest& request) const;
    pve::domain::Validated<pve::domain::PendingPayment> authorize(const CashPaymentRequest& request) const;

    // Validation followed by settlement at the clock's current time.
    pve::domain::Validated<pve::domain::PaidPayment> process_card_payment(const CardPaymentRequest& request) const;
    pve::domain::Validated<pve::domain::PaidPayment> process_check_payment(const CheckPaymentRequest& request) const;
    pve::domain::Validated<pve::domain::PaidPayment> process_cash_payment(const CashPaymentRequest& request) const;

    pve::domain::PaidPayment settle(pve::domain::PendingPayment&& pending) const;
    pve::domain::VoidPayment void_payment(pve::domain::PendingPayment&& pending) const;
    pve::domain::RefundedPayment refund_payment(pve::domain::PaidPayment&& paid) const;

    pve::domain::Validated<pve::domain::Credentials> validate_credentials(
        const CredentialsRequest& request,
        const pve::domain::PasswordPolicy& policy = pve::domain::PasswordPolicy{}) const;

private:
    pve::domain::Validated<pve::domain::PaidPayment> settle_if_valid(
        pve::domain::Validated<pve::domain::PendingPayment> pending) const;

    const IClock& clock_;
    pve::domain::CardPolicy card_policy_;
};

} // namespace pve::services
