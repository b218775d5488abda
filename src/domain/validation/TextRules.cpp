#include "domain/validation/TextRules.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <string>

namespace pve::domain::text {

namespace {

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

} // anonymous namespace

std::string trim(std::string_view input) {
    auto first = std::find_if_not(input.begin(), input.end(), is_space);
    auto last = std::find_if_not(input.rbegin(), input.rend(), is_space).base();
    if (first >= last) return {};
    return std::string(first, last);
}

std::string strip_spaces(std::string_view input) {
    std::string result;
    result.reserve(input.size());
    std::copy_if(input.begin(), input.end(), std::back_inserter(result),
                 [](char c) { return c != ' '; });
    return result;
}

std::size_t char_count(std::string_view input) noexcept {
    return static_cast<std::size_t>(std::count_if(input.begin(), input.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    }));
}

bool all_digits(std::string_view input) noexcept {
    return std::all_of(input.begin(), input.end(), is_digit);
}

std::string normalize_digits(std::string_view input) {
    return strip_spaces(trim(input));
}

bool check_digit_shape(ErrorAccumulator& errors, std::string_view normalized,
                       const std::string& field, const LengthBounds& bounds) {
    const auto before = errors.error_count();
    const auto length = normalized.size();

    errors.ensure(all_digits(normalized), [&] {
        return make_error<ShapeError>(ValidationRule::NonDigit, field,
            field + " must contain only digits (spaces allowed)");
    });
    errors.ensure(!normalized.empty(), [&] {
        return make_error<ShapeError>(ValidationRule::NonDigit, field,
            field + " must contain only digits (spaces allowed)");
    });
    if (bounds.max) {
        errors.ensure(length <= *bounds.max, [&] {
            return make_error<ShapeError>(ValidationRule::ExceedsMaxLength, field,
                field + " must be at most " + std::to_string(*bounds.max) + " digits");
        });
    }
    if (bounds.min) {
        errors.ensure(length >= *bounds.min, [&] {
            return make_error<ShapeError>(ValidationRule::BelowMinLength, field,
                field + " must be at least " + std::to_string(*bounds.min) + " digits");
        });
    }

    return errors.error_count() == before;
}

} // namespace pve::domain::text
