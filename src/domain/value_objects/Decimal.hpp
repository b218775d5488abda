#pragma once

#include <compare>
#include <cstdint>
#include <string>

namespace pve::domain {

// Exact fixed-point decimal: unscaled * 10^-scale, at most 18 digits.
// Comparison is numeric, so 99.9 == 99.90; to_string() keeps the scale.
class Decimal {
public:
    static constexpr int max_scale = 18;

    // Throws std::out_of_range if scale is outside [0, max_scale].
    Decimal(int64_t unscaled, int scale);

    // Accepts an optional sign, digits and an optional fraction ("-10.00").
    // Throws std::invalid_argument on malformed text, std::out_of_range on
    // more than 18 digits.
    static Decimal from_string(const std::string& str);
    static Decimal zero();

    int64_t unscaled() const noexcept { return unscaled_; }
    int scale() const noexcept { return scale_; }
    int signum() const noexcept;

    std::string to_string() const;

    std::strong_ordering operator<=>(const Decimal& other) const noexcept;
    bool operator==(const Decimal& other) const noexcept;

private:
    int64_t unscaled_;
    int scale_;
};

} // namespace pve::domain
