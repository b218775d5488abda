#include "domain/value_objects/EmailAddress.hpp"

#include "domain/validation/TextRules.hpp"

namespace pve::domain {

EmailAddress::EmailAddress(std::string value) : value_(std::move(value)) {}

Result<EmailAddress, ValidationError> EmailAddress::validate(
    std::string_view raw, const std::string& field) {
    auto trimmed = text::trim(raw);
    if (trimmed.empty() || trimmed.find('@') == std::string::npos) {
        return Result<EmailAddress, ValidationError>::failure(
            make_error<ShapeError>(ValidationRule::InvalidEmail, field,
                field + " must be a valid email address"));
    }
    return Result<EmailAddress, ValidationError>::success(EmailAddress(std::move(trimmed)));
}

std::optional<EmailAddress> EmailAddress::create(
    ErrorAccumulator& errors, std::string_view raw, const std::string& field) {
    return errors.bind(validate(raw, field));
}

} // namespace pve::domain
