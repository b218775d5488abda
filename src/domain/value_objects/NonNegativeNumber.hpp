#pragma once

#include "domain/value_objects/PositiveNumber.hpp"

#include <compare>
#include <optional>
#include <string>

namespace pve::domain {

// Zero or greater, e.g. a balance. NaN is rejected.
template <Numeric T>
class NonNegativeNumber {
public:
    static Result<NonNegativeNumber, ValidationError> validate(T raw, const std::string& field) {
        if (!(raw >= T{0})) {
            return Result<NonNegativeNumber, ValidationError>::failure(
                make_error<RangeError>(ValidationRule::Negative, field,
                    field + " must be a non-negative number (>= 0)"));
        }
        return Result<NonNegativeNumber, ValidationError>::success(NonNegativeNumber(raw));
    }

    static std::optional<NonNegativeNumber> create(
        ErrorAccumulator& errors, T raw, const std::string& field) {
        return errors.bind(validate(raw, field));
    }

    T value() const noexcept { return value_; }

    bool operator==(const NonNegativeNumber&) const = default;
    auto operator<=>(const NonNegativeNumber&) const = default;

private:
    explicit NonNegativeNumber(T value) : value_(value) {}

    T value_;
};

} // namespace pve::domain
