#include "config/Settings.hpp"

#include <cstdlib>
#include <stdexcept>

namespace pve::config {

namespace {

std::string env_or(const char* name, const std::string& fallback) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : fallback;
}

std::size_t env_size_or(const char* name, std::size_t fallback) {
    const char* val = std::getenv(name);
    if (!val) return fallback;
    try {
        std::size_t consumed = 0;
        long long parsed = std::stoll(val, &consumed);
        if (consumed != std::string(val).size() || parsed < 0) return fallback;
        return static_cast<std::size_t>(parsed);
    } catch (const std::logic_error&) {
        return fallback;
    }
}

bool env_bool_or(const char* name, bool fallback) {
    const char* val = std::getenv(name);
    if (!val) return fallback;
    std::string s(val);
    if (s == "true" || s == "1") return true;
    if (s == "false" || s == "0") return false;
    return fallback;
}

} // namespace

Settings Settings::from_environment() {
    std::string env = env_or("PVE_ENV", "development");
    Settings s = (env == "production") ? production() : development();

    auto& card = s.validation.card;
    pve::domain::CardPolicy overridden;
    overridden.number_max_length = env_size_or("PVE_CARD_NUMBER_MAX_LENGTH", card.number_max_length);
    overridden.cvv_min_length = env_size_or("PVE_CVV_MIN_LENGTH", card.cvv_min_length);
    overridden.cvv_max_length = env_size_or("PVE_CVV_MAX_LENGTH", card.cvv_max_length);
    // Bounds no card could satisfy keep the preset.
    if (overridden.number_max_length > 0 && overridden.cvv_max_length > 0 &&
        overridden.cvv_min_length <= overridden.cvv_max_length) {
        card = overridden;
    }

    auto& password = s.validation.password;
    password.min_length = env_size_or("PVE_PASSWORD_MIN_LENGTH", password.min_length);
    password.require_upper = env_bool_or("PVE_PASSWORD_REQUIRE_UPPER", password.require_upper);
    password.require_lower = env_bool_or("PVE_PASSWORD_REQUIRE_LOWER", password.require_lower);
    password.require_digit = env_bool_or("PVE_PASSWORD_REQUIRE_DIGIT", password.require_digit);
    password.require_symbol = env_bool_or("PVE_PASSWORD_REQUIRE_SYMBOL", password.require_symbol);
    return s;
}

Settings Settings::development() {
    Settings s;
    s.environment = "development";
    s.validation.password.min_length = 12;
    return s;
}

Settings Settings::production() {
    Settings s;
    s.environment = "production";
    s.validation.password.min_length = 16;
    return s;
}

} // namespace pve::config
