#pragma once

#include "domain/accounts/Credentials.hpp"
#include "domain/aggregates/Payment.hpp"
#include "domain/validation/ValidationErrors.hpp"
#include "services/PaymentRequests.hpp"

#include <string>

namespace pve::infrastructure {

class PaymentJsonCodec {
public:
    // Decodes a request object selected by its "type" field: "card", "check",
    // "cash" or "credentials". Malformed JSON and missing fields throw
    // nlohmann::json exceptions; an unknown type throws std::invalid_argument.
    pve::services::PaymentRequest parse_request(const std::string& json_str) const;

    std::string serialize(const pve::domain::Payment& payment) const;
    std::string serialize(const pve::domain::Credentials& credentials) const;
    std::string serialize_errors(const pve::domain::ValidationErrors& errors) const;
};

} // namespace pve::infrastructure
