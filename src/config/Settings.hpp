#pragma once

#include "domain/payment_methods/CreditCard.hpp"
#include "domain/value_objects/StrongPassword.hpp"

#include <string>

namespace pve::config {

struct ValidationSettings {
    pve::domain::CardPolicy card;
    pve::domain::PasswordPolicy password;
};

struct Settings {
    std::string environment = "development";  // "development" or "production"
    ValidationSettings validation;

    static Settings from_environment();
    static Settings development();
    static Settings production();
};

} // namespace pve::config
