#pragma once

#include "domain/validation/ErrorAccumulator.hpp"
#include "domain/validation/Result.hpp"
#include "domain/value_objects/Calendar.hpp"

#include <chrono>
#include <compare>
#include <optional>
#include <string>

namespace pve::domain {

// Calendar date strictly after a reference date (today by default).
class FutureDate {
public:
    static Result<FutureDate, ValidationError> validate(
        std::chrono::year_month_day date, const std::string& field,
        std::chrono::year_month_day after = calendar::today());

    static std::optional<FutureDate> create(
        ErrorAccumulator& errors, std::chrono::year_month_day date, const std::string& field,
        std::chrono::year_month_day after = calendar::today());

    std::chrono::year_month_day value() const noexcept { return value_; }
    std::string to_string() const { return calendar::format(value_); }

    bool operator==(const FutureDate&) const = default;
    auto operator<=>(const FutureDate&) const = default;

private:
    explicit FutureDate(std::chrono::year_month_day value);

    std::chrono::year_month_day value_;
};

} // namespace pve::domain
