#include "domain/validation/ErrorAccumulator.hpp"

namespace pve::domain {

void ErrorAccumulator::raise(ValidationError error) {
    errors_.push_back(std::move(error));
}

void ErrorAccumulator::raise(const ValidationErrors& errors) {
    errors_.insert(errors_.end(), errors.begin(), errors.end());
}

} // namespace pve::domain
