#include "domain/value_objects/StrongPassword.hpp"

#include "domain/validation/TextRules.hpp"

#include <algorithm>
#include <cctype>

namespace pve::domain {

namespace {

template <typename Predicate>
bool any_char(std::string_view s, Predicate predicate) {
    return std::any_of(s.begin(), s.end(), [&](char c) {
        return predicate(static_cast<unsigned char>(c)) != 0;
    });
}

bool has_upper(std::string_view s) { return any_char(s, [](unsigned char c) { return std::isupper(c); }); }
bool has_lower(std::string_view s) { return any_char(s, [](unsigned char c) { return std::islower(c); }); }
bool has_digit(std::string_view s) { return any_char(s, [](unsigned char c) { return std::isdigit(c); }); }
// ASCII punctuation, space and controls. Bytes of multi-byte characters are
// not symbols.
bool has_symbol(std::string_view s) {
    return any_char(s, [](unsigned char c) { return c < 0x80 && !std::isalnum(c); });
}

ValidationError missing(ValidationRule rule, const std::string& field, const char* what) {
    return make_error<CompositionError>(rule, field,
        field + " must contain at least one " + what);
}

} // anonymous namespace

StrongPassword::StrongPassword(std::string value) : value_(std::move(value)) {}

Validated<StrongPassword> StrongPassword::validate(
    std::string_view raw, const std::string& field, const PasswordPolicy& policy) {
    ErrorAccumulator errors;
    auto password = create(errors, raw, field, policy);
    return errors.finish(std::move(password));
}

std::optional<StrongPassword> StrongPassword::create(
    ErrorAccumulator& errors, std::string_view raw, const std::string& field,
    const PasswordPolicy& policy) {
    const auto before = errors.error_count();

    errors.ensure(!raw.empty() && text::char_count(raw) >= policy.min_length, [&] {
        return make_error<ShapeError>(ValidationRule::TooShort, field,
            field + " must be at least " + std::to_string(policy.min_length) +
            " characters long");
    });
    if (policy.require_upper) {
        errors.ensure(has_upper(raw), [&] {
            return missing(ValidationRule::MissingUppercase, field, "uppercase letter");
        });
    }
    if (policy.require_lower) {
        errors.ensure(has_lower(raw), [&] {
            return missing(ValidationRule::MissingLowercase, field, "lowercase letter");
        });
    }
    if (policy.require_digit) {
        errors.ensure(has_digit(raw), [&] {
            return missing(ValidationRule::MissingDigit, field, "digit");
        });
    }
    if (policy.require_symbol) {
        errors.ensure(has_symbol(raw), [&] {
            return missing(ValidationRule::MissingSymbol, field, "symbol");
        });
    }

    if (errors.error_count() != before) return std::nullopt;
    return StrongPassword(std::string(raw));
}

} // namespace pve::domain
