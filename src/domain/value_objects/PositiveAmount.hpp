#pragma once

#include "domain/validation/ErrorAccumulator.hpp"
#include "domain/validation/Result.hpp"
#include "domain/validation/ValidationError.hpp"
#include "domain/value_objects/Decimal.hpp"

#include <compare>
#include <optional>
#include <string>

namespace pve::domain {

// Currency amount strictly greater than zero.
class PositiveAmount {
public:
    static Result<PositiveAmount, ValidationError> validate(
        const Decimal& raw, const std::string& field);

    static std::optional<PositiveAmount> create(
        ErrorAccumulator& errors, const Decimal& raw, const std::string& field);

    const Decimal& value() const noexcept { return value_; }

    bool operator==(const PositiveAmount&) const = default;
    auto operator<=>(const PositiveAmount&) const = default;

private:
    explicit PositiveAmount(Decimal value);

    Decimal value_;
};

} // namespace pve::domain
