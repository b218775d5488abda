#include "domain/value_objects/ChecksumString.hpp"

#include "domain/checksums/Checksums.hpp"

namespace pve::domain {

ChecksumString::ChecksumString(std::string value) : value_(std::move(value)) {}

Validated<ChecksumString> ChecksumString::validate(
    std::string_view raw, const std::string& field, const LengthBounds& bounds) {
    ErrorAccumulator errors;
    auto number = create(errors, raw, field, bounds);
    return errors.finish(std::move(number));
}

std::optional<ChecksumString> ChecksumString::create(
    ErrorAccumulator& errors, std::string_view raw, const std::string& field,
    const LengthBounds& bounds) {
    auto normalized = text::normalize_digits(raw);
    if (!text::check_digit_shape(errors, normalized, field, bounds)) {
        return std::nullopt;
    }
    bool passes = errors.ensure(checksum::luhn_valid(normalized), [&] {
        return make_error<ChecksumError>(ValidationRule::Mod10Checksum, field,
            field + " failed MOD10 (Luhn) checksum");
    });
    if (!passes) return std::nullopt;
    return ChecksumString(std::move(normalized));
}

} // namespace pve::domain
