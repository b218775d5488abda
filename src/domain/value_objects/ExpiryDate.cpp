#include "domain/value_objects/ExpiryDate.hpp"

#include <algorithm>

namespace pve::domain {

namespace {

ValidationError past_expiry(const std::string& field, std::chrono::year_month now) {
    return make_error<TemporalError>(ValidationRule::PastExpiry, field,
        field + " must not be in the past (now is " + calendar::format(now) + ")");
}

} // anonymous namespace

ExpiryDate::ExpiryDate(std::chrono::year_month value) : value_(value) {}

Validated<ExpiryDate> ExpiryDate::validate(
    const std::string& field, int month, int year, std::chrono::year_month now) {
    ErrorAccumulator errors;
    auto expiry = create(errors, field, month, year, now);
    return errors.finish(std::move(expiry));
}

std::optional<ExpiryDate> ExpiryDate::create(
    ErrorAccumulator& errors, const std::string& field, int month, int year,
    std::chrono::year_month now) {
    bool month_ok = errors.ensure(month >= 1 && month <= 12, [&] {
        return make_error<RangeError>(ValidationRule::InvalidMonth, field,
            field + " month must be between 1 and 12 (was " + std::to_string(month) + ")");
    });
    bool year_ok = errors.ensure(year >= min_year && year <= max_year, [&] {
        return make_error<RangeError>(ValidationRule::InvalidYear, field,
            field + " year must be between 1 and 9999 (was " + std::to_string(year) + ")");
    });

    // Substitute a representable month/year so the past-date rule still runs.
    const auto candidate =
        std::chrono::year{std::clamp(year, min_year, max_year)} /
        std::chrono::month{static_cast<unsigned>(month_ok ? month : 1)};
    bool current = errors.ensure(candidate >= now, [&] { return past_expiry(field, now); });

    if (!month_ok || !year_ok || !current) return std::nullopt;
    return ExpiryDate(candidate);
}

Validated<ExpiryDate> ExpiryDate::validate(
    std::chrono::year_month year_month, const std::string& field, std::chrono::year_month now) {
    return validate(field, static_cast<int>(static_cast<unsigned>(year_month.month())),
                    static_cast<int>(year_month.year()), now);
}

} // namespace pve::domain
