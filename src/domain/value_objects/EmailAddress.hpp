#pragma once

#include "domain/validation/ErrorAccumulator.hpp"
#include "domain/validation/Result.hpp"
#include "domain/validation/ValidationError.hpp"

#include <compare>
#include <optional>
#include <string>
#include <string_view>

namespace pve::domain {

// Minimal shape check only: non-blank and contains '@'. Stores the trimmed text.
class EmailAddress {
public:
    static Result<EmailAddress, ValidationError> validate(
        std::string_view raw, const std::string& field = "email");

    static std::optional<EmailAddress> create(
        ErrorAccumulator& errors, std::string_view raw, const std::string& field = "email");

    const std::string& value() const noexcept { return value_; }

    bool operator==(const EmailAddress&) const = default;
    auto operator<=>(const EmailAddress&) const = default;

private:
    explicit EmailAddress(std::string value);

    std::string value_;
};

} // namespace pve::domain
