#pragma once

#include "domain/validation/ValidationErrors.hpp"

#include <cstddef>
#include <functional>
#include <type_traits>
#include <utility>
#include <variant>

namespace pve::domain {

// Holds either a validated value or the error(s) explaining why there is none.
// value()/error() on the wrong alternative throw std::bad_variant_access.
template <typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    static Result success(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    static Result failure(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    bool is_success() const noexcept { return state_.index() == 0; }
    bool is_failure() const noexcept { return state_.index() == 1; }
    explicit operator bool() const noexcept { return is_success(); }

    const T& value() const& { return std::get<0>(state_); }
    T&& value() && { return std::get<0>(std::move(state_)); }

    const E& error() const& { return std::get<1>(state_); }
    E&& error() && { return std::get<1>(std::move(state_)); }

    template <typename F>
    auto map(F&& f) const -> Result<std::invoke_result_t<F, const T&>, E> {
        using Mapped = Result<std::invoke_result_t<F, const T&>, E>;
        if (is_success()) return Mapped::success(std::invoke(std::forward<F>(f), value()));
        return Mapped::failure(error());
    }

    template <typename F>
    auto map_error(F&& f) const -> Result<T, std::invoke_result_t<F, const E&>> {
        using Mapped = Result<T, std::invoke_result_t<F, const E&>>;
        if (is_success()) return Mapped::success(value());
        return Mapped::failure(std::invoke(std::forward<F>(f), error()));
    }

    bool operator==(const Result&) const = default;

private:
    template <std::size_t I, typename U>
    Result(std::in_place_index_t<I> index, U&& payload)
        : state_(index, std::forward<U>(payload)) {}

    std::variant<T, E> state_;
};

// Result of a validation that may report several violations at once.
template <typename T>
using Validated = Result<T, ValidationErrors>;

} // namespace pve::domain
