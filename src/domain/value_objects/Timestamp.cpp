#include "domain/value_objects/Timestamp.hpp"

#include "domain/value_objects/Calendar.hpp"

#include <chrono>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace pve::domain {

Timestamp::Timestamp(int64_t milliseconds_since_epoch) : ms_(milliseconds_since_epoch) {
    if (milliseconds_since_epoch < 0) {
        throw std::out_of_range(
            "Timestamp must be non-negative, got: " + std::to_string(milliseconds_since_epoch));
    }
}

Timestamp Timestamp::now() {
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return Timestamp(std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count());
}

std::string Timestamp::to_iso8601() const {
    using namespace std::chrono;

    const sys_days day_point{days{ms_ / 86'400'000}};
    int64_t ms_of_day = ms_ % 86'400'000;

    std::ostringstream out;
    out << calendar::format(year_month_day{day_point}) << 'T' << std::setfill('0')
        << std::setw(2) << ms_of_day / 3'600'000 << ':'
        << std::setw(2) << ms_of_day / 60'000 % 60 << ':'
        << std::setw(2) << ms_of_day / 1'000 % 60 << '.'
        << std::setw(3) << ms_of_day % 1'000 << 'Z';
    return out.str();
}

} // namespace pve::domain
