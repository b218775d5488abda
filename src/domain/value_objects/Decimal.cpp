#include "domain/value_objects/Decimal.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdlib>
#include <stdexcept>

namespace pve::domain {

namespace {

constexpr std::array<int64_t, Decimal::max_scale + 1> powers_of_ten = [] {
    std::array<int64_t, Decimal::max_scale + 1> table{};
    int64_t p = 1;
    for (std::size_t i = 0; i < table.size(); ++i) {
        table[i] = p;
        if (i + 1 < table.size()) p *= 10;
    }
    return table;
}();

constexpr int max_digits = 18;

} // anonymous namespace

Decimal::Decimal(int64_t unscaled, int scale) : unscaled_(unscaled), scale_(scale) {
    if (scale < 0 || scale > max_scale) {
        throw std::out_of_range(
            "Decimal scale must be between 0 and 18, got: " + std::to_string(scale));
    }
    if (unscaled <= -powers_of_ten[max_digits] || unscaled >= powers_of_ten[max_digits]) {
        throw std::out_of_range(
            "Decimal supports at most 18 digits, got: " + std::to_string(unscaled));
    }
}

Decimal Decimal::from_string(const std::string& str) {
    std::size_t pos = 0;
    bool negative = false;
    if (pos < str.size() && (str[pos] == '+' || str[pos] == '-')) {
        negative = str[pos] == '-';
        ++pos;
    }

    int64_t unscaled = 0;
    int digits = 0;
    int scale = 0;
    bool seen_point = false;
    bool seen_digit = false;

    for (; pos < str.size(); ++pos) {
        char c = str[pos];
        if (c == '.') {
            if (seen_point) {
                throw std::invalid_argument("Invalid decimal: " + str);
            }
            seen_point = true;
            continue;
        }
        if (c < '0' || c > '9') {
            throw std::invalid_argument("Invalid decimal: " + str);
        }
        seen_digit = true;
        // Leading zeros do not count towards the digit budget.
        if (unscaled != 0 || c != '0') ++digits;
        if (digits > max_digits) {
            throw std::out_of_range("Decimal supports at most 18 digits: " + str);
        }
        if (seen_point) {
            if (++scale > max_scale) {
                throw std::out_of_range("Decimal supports at most 18 fraction digits: " + str);
            }
        }
        unscaled = unscaled * 10 + (c - '0');
    }

    if (!seen_digit) {
        throw std::invalid_argument("Invalid decimal: " + str);
    }
    return Decimal(negative ? -unscaled : unscaled, scale);
}

Decimal Decimal::zero() {
    return Decimal(0, 0);
}

int Decimal::signum() const noexcept {
    return (unscaled_ > 0) - (unscaled_ < 0);
}

std::string Decimal::to_string() const {
    auto digits = std::to_string(std::llabs(unscaled_));
    if (scale_ > 0) {
        if (digits.size() <= static_cast<std::size_t>(scale_)) {
            digits.insert(0, static_cast<std::size_t>(scale_) - digits.size() + 1, '0');
        }
        digits.insert(digits.size() - static_cast<std::size_t>(scale_), 1, '.');
    }
    return unscaled_ < 0 ? "-" + digits : digits;
}

std::strong_ordering Decimal::operator<=>(const Decimal& other) const noexcept {
    if (auto by_sign = signum() <=> other.signum(); by_sign != 0) {
        return by_sign;
    }

    // Same sign: compare magnitudes by integer part, then by fraction
    // widened to the larger scale. Both stay below 10^18.
    const int64_t a = std::llabs(unscaled_);
    const int64_t b = std::llabs(other.unscaled_);
    const int64_t a_int = a / powers_of_ten[scale_];
    const int64_t b_int = b / powers_of_ten[other.scale_];
    const int common = std::max(scale_, other.scale_);
    const int64_t a_frac = (a % powers_of_ten[scale_]) * powers_of_ten[common - scale_];
    const int64_t b_frac = (b % powers_of_ten[other.scale_]) * powers_of_ten[common - other.scale_];

    auto magnitude = (a_int != b_int) ? (a_int <=> b_int) : (a_frac <=> b_frac);
    return signum() < 0 ? 0 <=> magnitude : magnitude;
}

bool Decimal::operator==(const Decimal& other) const noexcept {
    return (*this <=> other) == 0;
}

} // namespace pve::domain
