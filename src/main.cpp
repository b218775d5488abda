#include "config/Settings.hpp"
#include "infrastructure/PaymentJsonCodec.hpp"
#include "infrastructure/SystemClock.hpp"
#include "services/PaymentService.hpp"

#include <nlohmann/json.hpp>

#include <exception>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitValidationFailed = 1;
constexpr int kExitBadInput = 2;

std::string read_input(const std::string& path) {
    if (path.empty() || path == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin),
                           std::istreambuf_iterator<char>());
    }
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("cannot open " + path);
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

template <typename T, typename Render>
int report(const pve::domain::Validated<T>& result,
           const pve::infrastructure::PaymentJsonCodec& codec, Render&& render) {
    if (result.is_failure()) {
        const auto& errors = result.error();
        std::cerr << "[payment] Rejected with " << errors.size() << " error(s): "
                  << errors.join("; ") << std::endl;
        std::cout << codec.serialize_errors(errors) << std::endl;
        return kExitValidationFailed;
    }
    std::cout << render(result.value()) << std::endl;
    return kExitSuccess;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc > 2) {
        std::cerr << "Usage: payment_engine [request.json|-]" << std::endl;
        return kExitBadInput;
    }
    std::string path = argc == 2 ? argv[1] : "-";

    auto settings = pve::config::Settings::from_environment();
    std::cerr << "[engine] Started (" << settings.environment << ")" << std::endl;

    pve::infrastructure::SystemClock clock;
    pve::services::PaymentService service(clock, settings.validation.card);
    pve::infrastructure::PaymentJsonCodec codec;

    try {
        auto request = codec.parse_request(read_input(path));

        return std::visit([&](const auto& req) -> int {
            using Request = std::decay_t<decltype(req)>;
            if constexpr (std::is_same_v<Request, pve::services::CardPaymentRequest>) {
                return report(service.process_card_payment(req), codec,
                    [&](const pve::domain::PaidPayment& paid) {
                        std::cerr << "[payment] Card payment settled, amount="
                                  << paid.amount().value().to_string() << std::endl;
                        return codec.serialize(pve::domain::Payment{paid});
                    });
            } else if constexpr (std::is_same_v<Request, pve::services::CheckPaymentRequest>) {
                return report(service.process_check_payment(req), codec,
                    [&](const pve::domain::PaidPayment& paid) {
                        std::cerr << "[payment] Check payment settled, amount="
                                  << paid.amount().value().to_string() << std::endl;
                        return codec.serialize(pve::domain::Payment{paid});
                    });
            } else if constexpr (std::is_same_v<Request, pve::services::CashPaymentRequest>) {
                return report(service.process_cash_payment(req), codec,
                    [&](const pve::domain::PaidPayment& paid) {
                        std::cerr << "[payment] Cash payment settled, amount="
                                  << paid.amount().value().to_string() << std::endl;
                        return codec.serialize(pve::domain::Payment{paid});
                    });
            } else {
                return report(service.validate_credentials(req, settings.validation.password), codec,
                    [&](const pve::domain::Credentials& credentials) {
                        std::cerr << "[payment] Credentials accepted" << std::endl;
                        return codec.serialize(credentials);
                    });
            }
        }, request);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[error] Malformed request: " << e.what() << std::endl;
        return kExitBadInput;
    } catch (const std::exception& e) {
        std::cerr << "[error] " << e.what() << std::endl;
        return kExitBadInput;
    }
}
