#pragma once

#include "domain/validation/ErrorAccumulator.hpp"
#include "domain/validation/Result.hpp"
#include "domain/value_objects/DigitString.hpp"
#include "domain/value_objects/RoutingNumber.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace pve::domain {

// Paper check drawn on a bank account.
class Check {
public:
    static Validated<Check> validate(std::string_view routing_number,
                                     std::string_view account_number);

    static std::optional<Check> create(ErrorAccumulator& errors,
                                       std::string_view routing_number,
                                       std::string_view account_number);

    const RoutingNumber& routing_number() const noexcept { return routing_number_; }
    const DigitString& account_number() const noexcept { return account_number_; }

    std::string account_last4() const;

    bool operator==(const Check&) const = default;

private:
    Check(RoutingNumber routing_number, DigitString account_number);

    RoutingNumber routing_number_;
    DigitString account_number_;
};

} // namespace pve::domain
