#include "domain/checksums/Checksums.hpp"

#include <array>
#include <cstddef>

namespace pve::domain::checksum {

namespace {

bool is_digit(char c) noexcept {
    return c >= '0' && c <= '9';
}

} // anonymous namespace

bool luhn_valid(std::string_view digits) noexcept {
    if (digits.empty()) return false;

    int sum = 0;
    std::size_t index = 0;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it, ++index) {
        if (!is_digit(*it)) return false;
        int n = *it - '0';
        if (index % 2 == 1) {
            n *= 2;
            if (n > 9) n -= 9;
        }
        sum += n;
    }
    return sum % 10 == 0;
}

bool aba_routing_valid(std::string_view digits) noexcept {
    static constexpr std::array<int, 8> weights{3, 7, 1, 3, 7, 1, 3, 7};

    if (digits.size() != 9) return false;
    for (char c : digits) {
        if (!is_digit(c)) return false;
    }

    int sum = 0;
    for (std::size_t i = 0; i < weights.size(); ++i) {
        sum += (digits[i] - '0') * weights[i];
    }
    int expected_check = (10 - (sum % 10)) % 10;
    return (digits[8] - '0') == expected_check;
}

} // namespace pve::domain::checksum
