#pragma once

#include "domain/validation/ErrorAccumulator.hpp"
#include "domain/validation/Result.hpp"
#include "domain/value_objects/Calendar.hpp"
#include "domain/value_objects/ChecksumString.hpp"
#include "domain/value_objects/DigitString.hpp"
#include "domain/value_objects/ExpiryDate.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace pve::domain {

struct CardPolicy {
    std::size_t number_max_length = 19;
    std::size_t cvv_min_length = 3;
    std::size_t cvv_max_length = 4;

    bool operator==(const CardPolicy&) const = default;
};

class CreditCard {
public:
    // Validates number, expiry and CVV together and reports every invalid
    // field in one result.
    static Validated<CreditCard> validate(
        std::string_view number, int expiry_month, int expiry_year, std::string_view cvv,
        std::chrono::year_month now = calendar::current_year_month(),
        const CardPolicy& policy = CardPolicy{});

    static std::optional<CreditCard> create(
        ErrorAccumulator& errors,
        std::string_view number, int expiry_month, int expiry_year, std::string_view cvv,
        std::chrono::year_month now = calendar::current_year_month(),
        const CardPolicy& policy = CardPolicy{});

    const ChecksumString& number() const noexcept { return number_; }
    const ExpiryDate& expiry() const noexcept { return expiry_; }
    const DigitString& cvv() const noexcept { return cvv_; }

    std::string last4() const;

    bool operator==(const CreditCard&) const = default;

private:
    CreditCard(ChecksumString number, ExpiryDate expiry, DigitString cvv);

    ChecksumString number_;
    ExpiryDate expiry_;
    DigitString cvv_;
};

} // namespace pve::domain
