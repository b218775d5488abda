#include "infrastructure/PaymentJsonCodec.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <variant>

using json = nlohmann::json;
using namespace pve::domain;
using namespace pve::services;

namespace pve::infrastructure {

namespace {

// Amounts may arrive as "99.99" or 99.99. Numbers go through their JSON text
// so no binary rounding is introduced.
Decimal parse_amount(const json& value) {
    if (value.is_string()) {
        return Decimal::from_string(value.get<std::string>());
    }
    if (value.is_number()) {
        return Decimal::from_string(value.dump());
    }
    throw std::invalid_argument("amount must be a string or a number");
}

// Month and year must be JSON integers that fit an int; anything else would be
// validated as a different value.
int parse_int_field(const json& obj, const char* name) {
    const auto& value = obj.at(name);
    if (!value.is_number_integer()) {
        throw std::invalid_argument(std::string(name) + " must be an integer");
    }
    bool in_range = value.is_number_unsigned()
        ? value.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())
        : value.get<std::int64_t>() >= std::numeric_limits<int>::min() &&
          value.get<std::int64_t>() <= std::numeric_limits<int>::max();
    if (!in_range) {
        throw std::invalid_argument(std::string(name) + " is out of range: " + value.dump());
    }
    return static_cast<int>(value.get<std::int64_t>());
}

CardPaymentRequest parse_card(const json& obj) {
    return CardPaymentRequest{
        obj.at("card_number").get<std::string>(),
        parse_int_field(obj, "expiry_month"),
        parse_int_field(obj, "expiry_year"),
        obj.at("cvv").get<std::string>(),
        parse_amount(obj.at("amount")),
    };
}

CheckPaymentRequest parse_check(const json& obj) {
    return CheckPaymentRequest{
        obj.at("routing_number").get<std::string>(),
        obj.at("account_number").get<std::string>(),
        parse_amount(obj.at("amount")),
    };
}

CashPaymentRequest parse_cash(const json& obj) {
    return CashPaymentRequest{parse_amount(obj.at("amount"))};
}

CredentialsRequest parse_credentials(const json& obj) {
    return CredentialsRequest{
        obj.at("email").get<std::string>(),
        obj.at("password").get<std::string>(),
    };
}

struct MethodToJson {
    json operator()(const Cash&) const {
        return {{"type", "CASH"}};
    }
    json operator()(const CreditCard& card) const {
        return {{"type", "CREDIT_CARD"},
                {"card_last4", card.last4()},
                {"expiry", card.expiry().to_string()}};
    }
    json operator()(const Check& check) const {
        return {{"type", "CHECK"},
                {"routing_number", check.routing_number().value()},
                {"account_last4", check.account_last4()}};
    }
};

json record_to_json(const PaymentRecord& record, PaymentStatus status) {
    return {{"status", std::string(status_to_string(status))},
            {"amount", record.amount().value().to_string()},
            {"payment_method", std::visit(MethodToJson{}, record.method())}};
}

struct PaymentToJson {
    json operator()(const PendingPayment& p) const {
        return record_to_json(p, PaymentStatus::PENDING);
    }
    json operator()(const PaidPayment& p) const {
        auto out = record_to_json(p, PaymentStatus::PAID);
        out["paid_at"] = p.paid_at().to_iso8601();
        return out;
    }
    json operator()(const VoidPayment& p) const {
        auto out = record_to_json(p, PaymentStatus::VOID);
        out["voided_at"] = p.voided_at().to_iso8601();
        return out;
    }
    json operator()(const RefundedPayment& p) const {
        auto out = record_to_json(p, PaymentStatus::REFUNDED);
        out["refunded_at"] = p.refunded_at().to_iso8601();
        return out;
    }
};

} // anonymous namespace

PaymentRequest PaymentJsonCodec::parse_request(const std::string& json_str) const {
    auto obj = json::parse(json_str);
    if (!obj.is_object()) {
        throw std::invalid_argument("request must be a JSON object");
    }

    auto type = obj.at("type").get<std::string>();
    if (type == "card") return parse_card(obj);
    if (type == "check") return parse_check(obj);
    if (type == "cash") return parse_cash(obj);
    if (type == "credentials") return parse_credentials(obj);
    throw std::invalid_argument("Unknown request type: " + type);
}

std::string PaymentJsonCodec::serialize(const Payment& payment) const {
    return std::visit(PaymentToJson{}, payment).dump();
}

std::string PaymentJsonCodec::serialize(const Credentials& credentials) const {
    return json{{"email", credentials.email().value()}}.dump();
}

std::string PaymentJsonCodec::serialize_errors(const ValidationErrors& errors) const {
    json items = json::array();
    for (const auto& error : errors) {
        items.push_back({{"field", field_of(error)},
                         {"kind", std::string(kind_name(error))},
                         {"rule", std::string(rule_name(rule_of(error)))},
                         {"message", message_of(error)}});
    }
    return json{{"message", "Validation failed"}, {"errors", items}}.dump();
}

} // namespace pve::infrastructure
