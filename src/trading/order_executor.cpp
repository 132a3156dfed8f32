#include "trading/order_executor.h"

#include <nlohmann/json.hpp>

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "common/logging.h"
#include "exchange/bybit_api.h"

namespace trading {

const char* toString(OrderSide side) {
    return side == OrderSide::Buy ? "Buy" : "Sell";
}

std::string formatQuantity(double quantity) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3) << quantity;
    std::string text = oss.str();

    const auto dot = text.find('.');
    if (dot != std::string::npos) {
        while (text.back() == '0') {
            text.pop_back();
        }
        if (text.back() == '.') {
            text.pop_back();
        }
    }
    if (text == "-0") {
        text = "0";
    }
    return text;
}

OrderExecutor::OrderExecutor(std::string baseUrl,
                             std::string apiKey,
                             std::string apiSecret,
                             exchange::HttpTransport transport)
    : baseUrl_(exchange::normalizeBaseUrl(std::move(baseUrl))),
      apiKey_(std::move(apiKey)),
      signer_(std::move(apiSecret)),
      transport_(std::move(transport)) {
    if (apiKey_.empty()) {
        throw std::invalid_argument("OrderExecutor requires an API key");
    }
    if (!transport_) {
        throw std::invalid_argument("OrderExecutor requires an HTTP transport");
    }
}

exchange::HttpResponse OrderExecutor::placeMarketOrder(OrderSide side,
                                                       const std::string& symbol,
                                                       double quantity) const {
    const security::Parameters params = signer_.signParameters({
        {"apiKey", apiKey_},
        {"symbol", symbol},
        {"side", toString(side)},
        {"orderType", kOrderType},
        {"qty", formatQuantity(quantity)},
        {"timestamp", exchange::timestampMillis()},
        {"timeInForce", kTimeInForce},
    });

    // ordered_json keeps "sign" as the final member.
    nlohmann::ordered_json body = nlohmann::ordered_json::object();
    for (const auto& [key, value] : params) {
        body[key] = value;
    }

    exchange::HttpRequest request;
    request.method = exchange::HttpMethod::Post;
    request.url = baseUrl_ + exchange::kCreateOrderPath;
    request.headers["Content-Type"] = "application/json";
    request.body = body.dump();
    request.timeout = exchange::kOrderTimeout;

    LOG_DEBUG("Submitting " + std::string(toString(side)) + " market order for " + symbol +
              " qty=" + formatQuantity(quantity));
    return transport_(request);
}

}  // namespace trading
