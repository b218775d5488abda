#pragma once

#include "domain/validation/ErrorAccumulator.hpp"
#include "domain/validation/Result.hpp"
#include "domain/validation/ValidationError.hpp"

#include <compare>
#include <optional>
#include <string>
#include <type_traits>

namespace pve::domain {

template <typename T>
concept Numeric = std::is_arithmetic_v<T> && !std::is_same_v<T, bool>;

// Strictly positive number. NaN is rejected.
template <Numeric T>
class PositiveNumber {
public:
    static Result<PositiveNumber, ValidationError> validate(T raw, const std::string& field) {
        if (!(raw > T{0})) {
            return Result<PositiveNumber, ValidationError>::failure(
                make_error<RangeError>(ValidationRule::NotPositive, field,
                    field + " must be a positive number (> 0)"));
        }
        return Result<PositiveNumber, ValidationError>::success(PositiveNumber(raw));
    }

    static std::optional<PositiveNumber> create(
        ErrorAccumulator& errors, T raw, const std::string& field) {
        return errors.bind(validate(raw, field));
    }

    T value() const noexcept { return value_; }

    bool operator==(const PositiveNumber&) const = default;
    auto operator<=>(const PositiveNumber&) const = default;

private:
    explicit PositiveNumber(T value) : value_(value) {}

    T value_;
};

} // namespace pve::domain
