#include "domain/payment_methods/Check.hpp"

#include "domain/validation/ZipOrAccumulate.hpp"

namespace pve::domain {

Check::Check(RoutingNumber routing_number, DigitString account_number)
    : routing_number_(std::move(routing_number))
    , account_number_(std::move(account_number)) {}

Validated<Check> Check::validate(std::string_view routing_number,
                                 std::string_view account_number) {
    return zip_or_accumulate(
        [](RoutingNumber routing, DigitString account) {
            return Check(std::move(routing), std::move(account));
        },
        [&] { return RoutingNumber::validate(routing_number, "routing number"); },
        [&] { return DigitString::validate(account_number, "account number"); });
}

std::optional<Check> Check::create(ErrorAccumulator& errors,
                                   std::string_view routing_number,
                                   std::string_view account_number) {
    return errors.bind(validate(routing_number, account_number));
}

std::string Check::account_last4() const {
    const auto& digits = account_number_.value();
    return digits.size() <= 4 ? digits : digits.substr(digits.size() - 4);
}

} // namespace pve::domain
