#include "domain/payment_methods/CreditCard.hpp"

#include "domain/validation/ZipOrAccumulate.hpp"

namespace pve::domain {

CreditCard::CreditCard(ChecksumString number, ExpiryDate expiry, DigitString cvv)
    : number_(std::move(number))
    , expiry_(expiry)
    , cvv_(std::move(cvv)) {}

Validated<CreditCard> CreditCard::validate(
    std::string_view number, int expiry_month, int expiry_year, std::string_view cvv,
    std::chrono::year_month now, const CardPolicy& policy) {
    return zip_or_accumulate(
        [](ChecksumString card_number, ExpiryDate expiry, DigitString cvv_code) {
            return CreditCard(std::move(card_number), expiry, std::move(cvv_code));
        },
        [&] {
            return ChecksumString::validate(
                number, "card number", LengthBounds::at_most(policy.number_max_length));
        },
        [&] { return ExpiryDate::validate("expiry date", expiry_month, expiry_year, now); },
        [&] {
            return DigitString::validate(
                cvv, "CVV", LengthBounds::between(policy.cvv_min_length, policy.cvv_max_length));
        });
}

std::optional<CreditCard> CreditCard::create(
    ErrorAccumulator& errors,
    std::string_view number, int expiry_month, int expiry_year, std::string_view cvv,
    std::chrono::year_month now, const CardPolicy& policy) {
    return errors.bind(validate(number, expiry_month, expiry_year, cvv, now, policy));
}

std::string CreditCard::last4() const {
    const auto& digits = number_.value();
    return digits.size() <= 4 ? digits : digits.substr(digits.size() - 4);
}

} // namespace pve::domain
