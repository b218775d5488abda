#include "domain/validation/ValidationError.hpp"

namespace pve::domain {

namespace {

template <typename... Fs>
struct overloaded : Fs... {
    using Fs::operator()...;
};

template <typename... Fs>
overloaded(Fs...) -> overloaded<Fs...>;

} // anonymous namespace

const FieldViolation& violation_of(const ValidationError& error) {
    return std::visit([](const auto& e) -> const FieldViolation& { return e; }, error);
}

const std::string& field_of(const ValidationError& error) {
    return violation_of(error).field;
}

const std::string& message_of(const ValidationError& error) {
    return violation_of(error).message;
}

ValidationRule rule_of(const ValidationError& error) {
    return violation_of(error).rule;
}

// No generic fallback: a new error kind must be named here.
std::string_view kind_name(const ValidationError& error) {
    return std::visit(overloaded{
        [](const ShapeError&) -> std::string_view { return "ShapeError"; },
        [](const RangeError&) -> std::string_view { return "RangeError"; },
        [](const ChecksumError&) -> std::string_view { return "ChecksumError"; },
        [](const TemporalError&) -> std::string_view { return "TemporalError"; },
        [](const CompositionError&) -> std::string_view { return "CompositionError"; },
    }, error);
}

std::string_view rule_name(ValidationRule rule) {
    switch (rule) {
        case ValidationRule::TooShort: return "TOO_SHORT";
        case ValidationRule::NotPositive: return "NOT_POSITIVE";
        case ValidationRule::Negative: return "NEGATIVE";
        case ValidationRule::NonDigit: return "NON_DIGIT";
        case ValidationRule::ExceedsMaxLength: return "EXCEEDS_MAX_LENGTH";
        case ValidationRule::BelowMinLength: return "BELOW_MIN_LENGTH";
        case ValidationRule::Mod10Checksum: return "MOD10_CHECKSUM";
        case ValidationRule::RoutingLength: return "ROUTING_LENGTH";
        case ValidationRule::AbaChecksum: return "ABA_CHECKSUM";
        case ValidationRule::InvalidMonth: return "INVALID_MONTH";
        case ValidationRule::InvalidYear: return "INVALID_YEAR";
        case ValidationRule::PastExpiry: return "PAST_EXPIRY";
        case ValidationRule::InvalidDate: return "INVALID_DATE";
        case ValidationRule::NotAfterReference: return "NOT_AFTER_REFERENCE";
        case ValidationRule::MissingUppercase: return "MISSING_UPPERCASE";
        case ValidationRule::MissingLowercase: return "MISSING_LOWERCASE";
        case ValidationRule::MissingDigit: return "MISSING_DIGIT";
        case ValidationRule::MissingSymbol: return "MISSING_SYMBOL";
        case ValidationRule::InvalidEmail: return "INVALID_EMAIL";
    }
    return "UNKNOWN";
}

} // namespace pve::domain
