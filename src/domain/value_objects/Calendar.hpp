#pragma once

#include <chrono>
#include <string>

namespace pve::domain::calendar {

// UTC calendar position of the system clock.
std::chrono::year_month current_year_month();
std::chrono::year_month_day today();

// "2024-08"
std::string format(std::chrono::year_month ym);
// "2024-08-01"
std::string format(std::chrono::year_month_day date);

} // namespace pve::domain::calendar
