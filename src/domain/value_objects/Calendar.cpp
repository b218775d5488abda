#include "domain/value_objects/Calendar.hpp"

#include <iomanip>
#include <sstream>

namespace pve::domain::calendar {

std::chrono::year_month current_year_month() {
    auto date = today();
    return date.year() / date.month();
}

std::chrono::year_month_day today() {
    return std::chrono::year_month_day{
        std::chrono::floor<std::chrono::days>(std::chrono::system_clock::now())};
}

std::string format(std::chrono::year_month ym) {
    std::ostringstream out;
    out << std::setfill('0') << std::setw(4) << static_cast<int>(ym.year()) << '-'
        << std::setw(2) << static_cast<unsigned>(ym.month());
    return out.str();
}

std::string format(std::chrono::year_month_day date) {
    std::ostringstream out;
    out << format(date.year() / date.month()) << '-'
        << std::setfill('0') << std::setw(2) << static_cast<unsigned>(date.day());
    return out.str();
}

} // namespace pve::domain::calendar
