#pragma once

#include "domain/validation/ErrorAccumulator.hpp"
#include "domain/validation/Result.hpp"
#include "domain/validation/TextRules.hpp"

#include <compare>
#include <optional>
#include <string>
#include <string_view>

namespace pve::domain {

// Non-empty string of ASCII digits. Spaces in the input are dropped, so
// "123 456" and "123456" produce the same value.
class DigitString {
public:
    static Validated<DigitString> validate(
        std::string_view raw, const std::string& field,
        const LengthBounds& bounds = LengthBounds::any());

    static std::optional<DigitString> create(
        ErrorAccumulator& errors, std::string_view raw, const std::string& field,
        const LengthBounds& bounds = LengthBounds::any());

    const std::string& value() const noexcept { return value_; }

    bool operator==(const DigitString&) const = default;
    auto operator<=>(const DigitString&) const = default;

private:
    explicit DigitString(std::string value);

    std::string value_;
};

} // namespace pve::domain
