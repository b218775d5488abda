#include "domain/payment_methods/PaymentMethod.hpp"

namespace pve::domain {

namespace {

struct MethodTypeName {
    std::string_view operator()(const Cash&) const { return "CASH"; }
    std::string_view operator()(const CreditCard&) const { return "CREDIT_CARD"; }
    std::string_view operator()(const Check&) const { return "CHECK"; }
};

} // anonymous namespace

std::string_view payment_method_type(const PaymentMethod& method) {
    return std::visit(MethodTypeName{}, method);
}

} // namespace pve::domain
