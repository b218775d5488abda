#pragma once

namespace pve::domain {

struct Cash {
    bool operator==(const Cash&) const = default;
};

} // namespace pve::domain
