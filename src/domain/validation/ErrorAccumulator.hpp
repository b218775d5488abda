#pragma once

#include "domain/validation/Result.hpp"
#include "domain/validation/ValidationError.hpp"
#include "domain/validation/ValidationErrors.hpp"

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace pve::domain {

// Explicit error channel threaded through composed validations. Each step
// records its failures here and keeps going; the caller decides at the end
// whether a value may be built.
class ErrorAccumulator {
public:
    // Records make_error() when condition is false. Returns condition.
    template <typename MakeError>
    bool ensure(bool condition, MakeError&& make_error) {
        if (!condition) {
            raise(std::forward<MakeError>(make_error)());
        }
        return condition;
    }

    void raise(ValidationError error);
    void raise(const ValidationErrors& errors);

    // Unwraps a step's result, recording its errors on failure.
    template <typename T, typename E>
    std::optional<T> bind(Result<T, E> result) {
        if (result.is_success()) {
            return std::optional<T>(std::move(result).value());
        }
        raise(std::move(result).error());
        return std::nullopt;
    }

    bool ok() const noexcept { return errors_.empty(); }
    std::size_t error_count() const noexcept { return errors_.size(); }
    const std::vector<ValidationError>& errors() const noexcept { return errors_; }

    // Success only when nothing was recorded and a value was produced.
    template <typename T>
    Validated<T> finish(std::optional<T> value) const {
        if (ok() && value.has_value()) {
            return Validated<T>::success(std::move(*value));
        }
        return Validated<T>::failure(ValidationErrors::from_vector(errors_));
    }

private:
    std::vector<ValidationError> errors_;
};

} // namespace pve::domain
