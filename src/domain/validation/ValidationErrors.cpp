#include "domain/validation/ValidationErrors.hpp"

#include <stdexcept>

namespace pve::domain {

ValidationErrors::ValidationErrors(ValidationError first)
    : errors_{std::move(first)} {}

ValidationErrors::ValidationErrors(std::vector<ValidationError> errors)
    : errors_(std::move(errors)) {}

ValidationErrors ValidationErrors::from_vector(std::vector<ValidationError> errors) {
    if (errors.empty()) {
        throw std::invalid_argument("ValidationErrors requires at least one error");
    }
    return ValidationErrors(std::move(errors));
}

ValidationErrors ValidationErrors::concat(const ValidationErrors& other) const {
    auto combined = errors_;
    combined.insert(combined.end(), other.errors_.begin(), other.errors_.end());
    return ValidationErrors(std::move(combined));
}

std::vector<std::string> ValidationErrors::messages() const {
    std::vector<std::string> result;
    result.reserve(errors_.size());
    for (const auto& error : errors_) {
        result.push_back(message_of(error));
    }
    return result;
}

std::string ValidationErrors::join(std::string_view separator) const {
    std::string result;
    for (std::size_t i = 0; i < errors_.size(); ++i) {
        if (i > 0) result += separator;
        result += message_of(errors_[i]);
    }
    return result;
}

} // namespace pve::domain
