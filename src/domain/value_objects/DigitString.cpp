#include "domain/value_objects/DigitString.hpp"

namespace pve::domain {

DigitString::DigitString(std::string value) : value_(std::move(value)) {}

Validated<DigitString> DigitString::validate(
    std::string_view raw, const std::string& field, const LengthBounds& bounds) {
    ErrorAccumulator errors;
    auto digits = create(errors, raw, field, bounds);
    return errors.finish(std::move(digits));
}

std::optional<DigitString> DigitString::create(
    ErrorAccumulator& errors, std::string_view raw, const std::string& field,
    const LengthBounds& bounds) {
    auto normalized = text::normalize_digits(raw);
    if (!text::check_digit_shape(errors, normalized, field, bounds)) {
        return std::nullopt;
    }
    return DigitString(std::move(normalized));
}

} // namespace pve::domain
