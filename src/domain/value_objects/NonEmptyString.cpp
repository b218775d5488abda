#include "domain/value_objects/NonEmptyString.hpp"

#include "domain/validation/TextRules.hpp"

namespace pve::domain {

NonEmptyString::NonEmptyString(std::string value) : value_(std::move(value)) {}

Result<NonEmptyString, ValidationError> NonEmptyString::validate(
    std::string_view raw, const std::string& field, std::size_t min_length) {
    auto trimmed = text::trim(raw);
    if (text::char_count(trimmed) < min_length) {
        return Result<NonEmptyString, ValidationError>::failure(
            make_error<ShapeError>(ValidationRule::TooShort, field,
                field + " must be at least " + std::to_string(min_length) +
                " characters long"));
    }
    return Result<NonEmptyString, ValidationError>::success(NonEmptyString(std::move(trimmed)));
}

std::optional<NonEmptyString> NonEmptyString::create(
    ErrorAccumulator& errors, std::string_view raw, const std::string& field,
    std::size_t min_length) {
    return errors.bind(validate(raw, field, min_length));
}

} // namespace pve::domain
