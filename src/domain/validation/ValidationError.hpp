#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace pve::domain {

enum class ValidationRule {
    TooShort,
    NotPositive,
    Negative,
    NonDigit,
    ExceedsMaxLength,
    BelowMinLength,
    Mod10Checksum,
    RoutingLength,
    AbaChecksum,
    InvalidMonth,
    InvalidYear,
    PastExpiry,
    InvalidDate,
    NotAfterReference,
    MissingUppercase,
    MissingLowercase,
    MissingDigit,
    MissingSymbol,
    InvalidEmail,
};

struct FieldViolation {
    ValidationRule rule;
    std::string field;
    std::string message;

    bool operator==(const FieldViolation&) const = default;
};

// Wrong primitive shape: empty, non-digit characters, wrong length.
struct ShapeError : FieldViolation {
    bool operator==(const ShapeError&) const = default;
};

// Numeric value outside its required range.
struct RangeError : FieldViolation {
    bool operator==(const RangeError&) const = default;
};

// Well-shaped value that fails a checksum.
struct ChecksumError : FieldViolation {
    bool operator==(const ChecksumError&) const = default;
};

// Date or time that does not satisfy a temporal constraint.
struct TemporalError : FieldViolation {
    bool operator==(const TemporalError&) const = default;
};

// A composite constraint over the value, e.g. password character classes.
struct CompositionError : FieldViolation {
    bool operator==(const CompositionError&) const = default;
};

using ValidationError =
    std::variant<ShapeError, RangeError, ChecksumError, TemporalError, CompositionError>;

template <typename Kind>
ValidationError make_error(ValidationRule rule, std::string field, std::string message) {
    return Kind{{rule, std::move(field), std::move(message)}};
}

const FieldViolation& violation_of(const ValidationError& error);
const std::string& field_of(const ValidationError& error);
const std::string& message_of(const ValidationError& error);
ValidationRule rule_of(const ValidationError& error);

std::string_view kind_name(const ValidationError& error);
std::string_view rule_name(ValidationRule rule);

} // namespace pve::domain
