#pragma once

#include "domain/validation/ErrorAccumulator.hpp"
#include "domain/validation/Result.hpp"
#include "domain/value_objects/EmailAddress.hpp"
#include "domain/value_objects/StrongPassword.hpp"

#include <optional>
#include <string_view>

namespace pve::domain {

// Sign-in pair. Email and password problems are reported together.
class Credentials {
public:
    static Validated<Credentials> validate(std::string_view email, std::string_view password,
                                           const PasswordPolicy& policy = PasswordPolicy{});

    static std::optional<Credentials> create(ErrorAccumulator& errors,
                                             std::string_view email, std::string_view password,
                                             const PasswordPolicy& policy = PasswordPolicy{});

    const EmailAddress& email() const noexcept { return email_; }
    const StrongPassword& password() const noexcept { return password_; }

    bool operator==(const Credentials&) const = default;

private:
    Credentials(EmailAddress email, StrongPassword password);

    EmailAddress email_;
    StrongPassword password_;
};

} // namespace pve::domain
