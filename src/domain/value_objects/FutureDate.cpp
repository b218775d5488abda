#include "domain/value_objects/FutureDate.hpp"

namespace pve::domain {

FutureDate::FutureDate(std::chrono::year_month_day value) : value_(value) {}

Result<FutureDate, ValidationError> FutureDate::validate(
    std::chrono::year_month_day date, const std::string& field,
    std::chrono::year_month_day after) {
    if (!date.ok()) {
        return Result<FutureDate, ValidationError>::failure(
            make_error<ShapeError>(ValidationRule::InvalidDate, field,
                field + " must be a valid calendar date"));
    }
    if (!(date > after)) {
        return Result<FutureDate, ValidationError>::failure(
            make_error<TemporalError>(ValidationRule::NotAfterReference, field,
                field + " must be after " + calendar::format(after)));
    }
    return Result<FutureDate, ValidationError>::success(FutureDate(date));
}

std::optional<FutureDate> FutureDate::create(
    ErrorAccumulator& errors, std::chrono::year_month_day date, const std::string& field,
    std::chrono::year_month_day after) {
    return errors.bind(validate(date, field, after));
}

} // namespace pve::domain
