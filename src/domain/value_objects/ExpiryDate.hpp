#pragma once

#include "domain/validation/ErrorAccumulator.hpp"
#include "domain/validation/Result.hpp"
#include "domain/value_objects/Calendar.hpp"

#include <chrono>
#include <compare>
#include <optional>
#include <string>

namespace pve::domain {

// Card expiry month that is not before the reference month.
class ExpiryDate {
public:
    static constexpr int min_year = 1;
    static constexpr int max_year = 9999;

    // Month and year are checked independently of the past-date rule, so an
    // out-of-range month that is also in the past reports both problems.
    static Validated<ExpiryDate> validate(
        const std::string& field, int month, int year,
        std::chrono::year_month now = calendar::current_year_month());

    static std::optional<ExpiryDate> create(
        ErrorAccumulator& errors, const std::string& field, int month, int year,
        std::chrono::year_month now = calendar::current_year_month());

    // Same rules as the (month, year) form: a year_month may still hold
    // month 13 or year 0.
    static Validated<ExpiryDate> validate(
        std::chrono::year_month year_month, const std::string& field,
        std::chrono::year_month now = calendar::current_year_month());

    std::chrono::year_month value() const noexcept { return value_; }
    int month() const noexcept { return static_cast<int>(static_cast<unsigned>(value_.month())); }
    int year() const noexcept { return static_cast<int>(value_.year()); }

    std::string to_string() const { return calendar::format(value_); }

    bool operator==(const ExpiryDate&) const = default;
    auto operator<=>(const ExpiryDate&) const = default;

private:
    explicit ExpiryDate(std::chrono::year_month value);

    std::chrono::year_month value_;
};

} // namespace pve::domain
