#pragma once

#include "domain/value_objects/Timestamp.hpp"

#include <chrono>

namespace pve::services {

class IClock {
public:
    virtual pve::domain::Timestamp now() const = 0;
    virtual std::chrono::year_month current_year_month() const = 0;
    virtual ~IClock() = default;
};

} // namespace pve::services
