#pragma once

#include "domain/validation/ErrorAccumulator.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace pve::domain {

struct LengthBounds {
    std::optional<std::size_t> min;
    std::optional<std::size_t> max;

    static LengthBounds any() { return {}; }
    static LengthBounds at_most(std::size_t max) { return {std::nullopt, max}; }
    static LengthBounds at_least(std::size_t min) { return {min, std::nullopt}; }
    static LengthBounds between(std::size_t min, std::size_t max) { return {min, max}; }

    bool operator==(const LengthBounds&) const = default;
};

namespace text {

std::string trim(std::string_view input);

// Removes every ' ' character. Other whitespace is left in place.
std::string strip_spaces(std::string_view input);

// Number of UTF-8 encoded characters: continuation bytes are not counted.
std::size_t char_count(std::string_view input) noexcept;

// True for the empty string.
bool all_digits(std::string_view input) noexcept;

// trim + strip_spaces, the normal form of every digit-bearing value.
std::string normalize_digits(std::string_view input);

// Records the shape violations of an already-normalized digit string:
// non-digit characters, emptiness, and the optional length bounds. Returns
// true when none were found.
bool check_digit_shape(ErrorAccumulator& errors, std::string_view normalized,
                       const std::string& field, const LengthBounds& bounds);

} // namespace text

} // namespace pve::domain
