#pragma once

#include <string>

#include "exchange/http_transport.h"
#include "security/request_signer.h"

namespace trading {

enum class OrderSide { Buy, Sell };

// "Buy" / "Sell", the casing the order endpoint expects.
const char* toString(OrderSide side);

// Renders a quantity with at most three decimals and no trailing zeros.
std::string formatQuantity(double quantity);

// OrderExecutor submits signed market orders. It does not interpret the
// exchange's answer: the raw status and body go back to the caller. Transport
// failures propagate as exceptions and are never retried.
class OrderExecutor {
public:
    static constexpr const char* kOrderType = "Market";
    static constexpr const char* kTimeInForce = "GoodTillCancel";

    OrderExecutor(std::string baseUrl,
                  std::string apiKey,
                  std::string apiSecret,
                  exchange::HttpTransport transport);

    exchange::HttpResponse placeMarketOrder(OrderSide side, const std::string& symbol, double quantity) const;

private:
    std::string baseUrl_;
    std::string apiKey_;
    security::RequestSigner signer_;
    exchange::HttpTransport transport_;
};

}  // namespace trading
