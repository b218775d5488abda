#pragma once

#include "domain/validation/ValidationError.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace pve::domain {

// Non-empty, ordered list of validation errors. Order is the order in which
// the failing rules were evaluated.
class ValidationErrors {
public:
    explicit ValidationErrors(ValidationError first);

    // Throws std::invalid_argument if errors is empty.
    static ValidationErrors from_vector(std::vector<ValidationError> errors);

    const ValidationError& head() const noexcept { return errors_.front(); }
    std::size_t size() const noexcept { return errors_.size(); }
    const ValidationError& operator[](std::size_t index) const { return errors_.at(index); }

    auto begin() const noexcept { return errors_.begin(); }
    auto end() const noexcept { return errors_.end(); }
    const std::vector<ValidationError>& all() const noexcept { return errors_; }

    ValidationErrors concat(const ValidationErrors& other) const;

    std::vector<std::string> messages() const;
    std::string join(std::string_view separator) const;

    bool operator==(const ValidationErrors&) const = default;

private:
    explicit ValidationErrors(std::vector<ValidationError> errors);

    std::vector<ValidationError> errors_;
};

} // namespace pve::domain
