#include "domain/value_objects/PositiveAmount.hpp"

namespace pve::domain {

PositiveAmount::PositiveAmount(Decimal value) : value_(value) {}

Result<PositiveAmount, ValidationError> PositiveAmount::validate(
    const Decimal& raw, const std::string& field) {
    if (raw.signum() <= 0) {
        return Result<PositiveAmount, ValidationError>::failure(
            make_error<RangeError>(ValidationRule::NotPositive, field,
                field + " must be a positive amount (> 0)"));
    }
    return Result<PositiveAmount, ValidationError>::success(PositiveAmount(raw));
}

std::optional<PositiveAmount> PositiveAmount::create(
    ErrorAccumulator& errors, const Decimal& raw, const std::string& field) {
    return errors.bind(validate(raw, field));
}

} // namespace pve::domain
