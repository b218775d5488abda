#pragma once

#include "domain/validation/ErrorAccumulator.hpp"
#include "domain/validation/Result.hpp"
#include "domain/validation/TextRules.hpp"

#include <compare>
#include <optional>
#include <string>
#include <string_view>

namespace pve::domain {

// Digit string that passes the MOD10 (Luhn) check, e.g. a card number.
// The checksum is only computed once the shape rules have passed.
class ChecksumString {
public:
    static Validated<ChecksumString> validate(
        std::string_view raw, const std::string& field,
        const LengthBounds& bounds = LengthBounds::any());

    static std::optional<ChecksumString> create(
        ErrorAccumulator& errors, std::string_view raw, const std::string& field,
        const LengthBounds& bounds = LengthBounds::any());

    const std::string& value() const noexcept { return value_; }

    bool operator==(const ChecksumString&) const = default;
    auto operator<=>(const ChecksumString&) const = default;

private:
    explicit ChecksumString(std::string value);

    std::string value_;
};

} // namespace pve::domain
