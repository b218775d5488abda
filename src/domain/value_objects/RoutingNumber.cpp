#include "domain/value_objects/RoutingNumber.hpp"

#include "domain/checksums/Checksums.hpp"
#include "domain/validation/TextRules.hpp"

namespace pve::domain {

RoutingNumber::RoutingNumber(std::string value) : value_(std::move(value)) {}

Validated<RoutingNumber> RoutingNumber::validate(std::string_view raw, const std::string& field) {
    ErrorAccumulator errors;
    auto routing = create(errors, raw, field);
    return errors.finish(std::move(routing));
}

std::optional<RoutingNumber> RoutingNumber::create(
    ErrorAccumulator& errors, std::string_view raw, const std::string& field) {
    auto normalized = text::normalize_digits(raw);

    bool digits = errors.ensure(text::all_digits(normalized), [&] {
        return make_error<ShapeError>(ValidationRule::NonDigit, field,
            field + " must contain only digits (spaces allowed)");
    });
    bool correct_length = errors.ensure(normalized.size() == length, [&] {
        return make_error<ShapeError>(ValidationRule::RoutingLength, field,
            field + " must be exactly 9 digits long");
    });
    if (!digits || !correct_length) return std::nullopt;

    bool passes = errors.ensure(checksum::aba_routing_valid(normalized), [&] {
        return make_error<ChecksumError>(ValidationRule::AbaChecksum, field,
            field + " failed ABA routing checksum");
    });
    if (!passes) return std::nullopt;
    return RoutingNumber(std::move(normalized));
}

} // namespace pve::domain
