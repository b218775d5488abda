#pragma once

#include "services/IClock.hpp"

namespace pve::infrastructure {

class SystemClock : public pve::services::IClock {
public:
    pve::domain::Timestamp now() const override;
    std::chrono::year_month current_year_month() const override;
};

} // namespace pve::infrastructure
