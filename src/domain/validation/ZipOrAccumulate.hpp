#pragma once

#include "domain/validation/ErrorAccumulator.hpp"
#include "domain/validation/Result.hpp"

#include <functional>
#include <optional>
#include <tuple>
#include <type_traits>
#include <utility>

namespace pve::domain {

template <typename Step>
using step_value_t = typename std::remove_cvref_t<std::invoke_result_t<Step>>::value_type;

// Runs every step, left to right, whatever the earlier steps returned. If all
// of them succeed the values are handed to combine; otherwise the errors of
// the failing steps are returned in step order and combine is never called.
template <typename Combine, typename... Steps>
auto zip_or_accumulate(Combine&& combine, Steps&&... steps)
    -> Validated<std::invoke_result_t<Combine, step_value_t<Steps>...>> {
    using Combined = std::invoke_result_t<Combine, step_value_t<Steps>...>;

    ErrorAccumulator errors;
    // Braced initialization sequences the steps left to right.
    std::tuple<std::optional<step_value_t<Steps>>...> values{
        errors.bind(std::invoke(std::forward<Steps>(steps)))...};

    if (!errors.ok()) {
        return errors.finish<Combined>(std::nullopt);
    }
    return std::apply(
        [&combine](auto&... value) {
            return Validated<Combined>::success(
                std::invoke(std::forward<Combine>(combine), std::move(*value)...));
        },
        values);
}

} // namespace pve::domain
