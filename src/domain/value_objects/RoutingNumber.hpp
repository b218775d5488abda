#pragma once

#include "domain/validation/ErrorAccumulator.hpp"
#include "domain/validation/Result.hpp"

#include <compare>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace pve::domain {

// Nine-digit ABA bank routing number with a valid check digit.
class RoutingNumber {
public:
    static constexpr std::size_t length = 9;

    static Validated<RoutingNumber> validate(std::string_view raw, const std::string& field);

    static std::optional<RoutingNumber> create(
        ErrorAccumulator& errors, std::string_view raw, const std::string& field);

    const std::string& value() const noexcept { return value_; }

    bool operator==(const RoutingNumber&) const = default;
    auto operator<=>(const RoutingNumber&) const = default;

private:
    explicit RoutingNumber(std::string value);

    std::string value_;
};

} // namespace pve::domain
