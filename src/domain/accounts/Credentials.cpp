#include "domain/accounts/Credentials.hpp"

#include "domain/validation/ZipOrAccumulate.hpp"

namespace pve::domain {

Credentials::Credentials(EmailAddress email, StrongPassword password)
    : email_(std::move(email))
    , password_(std::move(password)) {}

Validated<Credentials> Credentials::validate(std::string_view email, std::string_view password,
                                             const PasswordPolicy& policy) {
    return zip_or_accumulate(
        [](EmailAddress address, StrongPassword secret) {
            return Credentials(std::move(address), std::move(secret));
        },
        [&] { return EmailAddress::validate(email, "email"); },
        [&] { return StrongPassword::validate(password, "password", policy); });
}

std::optional<Credentials> Credentials::create(ErrorAccumulator& errors,
                                               std::string_view email, std::string_view password,
                                               const PasswordPolicy& policy) {
    return errors.bind(validate(email, password, policy));
}

} // namespace pve::domain
