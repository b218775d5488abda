#pragma once

#include <string_view>

namespace pve::domain::checksum {

// MOD10 (Luhn). Every second digit from the right is doubled, with 9
// subtracted when the product exceeds 9; the digit sum must be a multiple of 10.
// Returns false for empty or non-digit input.
bool luhn_valid(std::string_view digits) noexcept;

// ABA routing number: weights 3,7,1 over the first eight digits, the ninth is
// the check digit (10 - sum % 10) % 10. Returns false unless given 9 digits.
bool aba_routing_valid(std::string_view digits) noexcept;

} // namespace pve::domain::checksum
