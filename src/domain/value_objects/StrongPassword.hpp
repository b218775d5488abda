#pragma once

#include "domain/validation/ErrorAccumulator.hpp"
#include "domain/validation/Result.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace pve::domain {

struct PasswordPolicy {
    std::size_t min_length = 12;
    bool require_upper = true;
    bool require_lower = true;
    bool require_digit = true;
    bool require_symbol = true;

    bool operator==(const PasswordPolicy&) const = default;
};

// Password that satisfies a PasswordPolicy. The text is kept as given; no
// trimming.
class StrongPassword {
public:
    static Validated<StrongPassword> validate(
        std::string_view raw, const std::string& field,
        const PasswordPolicy& policy = PasswordPolicy{});

    static std::optional<StrongPassword> create(
        ErrorAccumulator& errors, std::string_view raw, const std::string& field,
        const PasswordPolicy& policy = PasswordPolicy{});

    const std::string& value() const noexcept { return value_; }

    bool operator==(const StrongPassword&) const = default;

private:
    explicit StrongPassword(std::string value);

    std::string value_;
};

} // namespace pve::domain
