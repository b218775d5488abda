#include "infrastructure/SystemClock.hpp"

#include "domain/value_objects/Calendar.hpp"

namespace pve::infrastructure {

pve::domain::Timestamp SystemClock::now() const {
    return pve::domain::Timestamp::now();
}

std::chrono::year_month SystemClock::current_year_month() const {
    return pve::domain::calendar::current_year_month();
}

} // namespace pve::infrastructure
