#pragma once

#include "domain/validation/ErrorAccumulator.hpp"
#include "domain/validation/Result.hpp"
#include "domain/validation/ValidationError.hpp"

#include <compare>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace pve::domain {

// Text whose trimmed length is at least min_length. Stores the trimmed text.
class NonEmptyString {
public:
    static Result<NonEmptyString, ValidationError> validate(
        std::string_view raw, const std::string& field, std::size_t min_length = 1);

    static std::optional<NonEmptyString> create(
        ErrorAccumulator& errors, std::string_view raw, const std::string& field,
        std::size_t min_length = 1);

    const std::string& value() const noexcept { return value_; }

    bool operator==(const NonEmptyString&) const = default;
    auto operator<=>(const NonEmptyString&) const = default;

private:
    explicit NonEmptyString(std::string value);

    std::string value_;
};

} // namespace pve::domain
