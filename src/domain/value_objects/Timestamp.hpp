#pragma once

#include <compare>
#include <cstdint>
#include <string>

namespace pve::domain {

// Milliseconds since the Unix epoch, UTC.
class Timestamp {
public:
    explicit Timestamp(int64_t milliseconds_since_epoch);

    static Timestamp now();

    int64_t milliseconds() const noexcept { return ms_; }

    // "2024-08-15T10:30:00.123Z"
    std::string to_iso8601() const;

    bool operator==(const Timestamp&) const = default;
    auto operator<=>(const Timestamp&) const = default;

private:
    int64_t ms_;
};

} // namespace pve::domain
