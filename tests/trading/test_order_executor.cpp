#include "trading/order_executor.h"

#include <nlohmann/json.hpp>

#include <iostream>
#include <stdexcept>
#include <string>

#include "security/request_signer.h"
#include "support/fakes.h"

namespace {

using test_support::Expect;
using test_support::ScriptedTransport;

bool TestFormatQuantity() {
    bool ok = Expect(trading::formatQuantity(20.93) == "20.93", "20.93 should render as 20.93");
    ok &= Expect(trading::formatQuantity(21.0) == "21", "21.0 should render as 21");
    ok &= Expect(trading::formatQuantity(0.0) == "0", "Zero should render as 0");
    ok &= Expect(trading::formatQuantity(0.1234) == "0.123", "Should keep three decimals at most");
    return ok;
}

bool TestMarketOrderPayload() {
    ScriptedTransport transport([](const exchange::HttpRequest&) {
        return exchange::HttpResponse{200, R"({"retCode":0,"result":{"orderId":"abc"}})"};
    });
    const trading::OrderExecutor executor("https://api.example.com", "key-1", "secret-1", transport.transport());

    const auto response = executor.placeMarketOrder(trading::OrderSide::Sell, "SOLUSDT.P", 20.927);
    if (!Expect(response.status_code == 200, "Raw status should be passed through")) {
        return false;
    }

    const auto requests = transport.requests();
    if (!Expect(requests.size() == 1, "Expected one order request")) {
        return false;
    }
    const auto& request = requests.front();
    bool ok = Expect(request.method == exchange::HttpMethod::Post, "Order must be a POST");
    ok &= Expect(request.url == "https://api.example.com/v5/order/create", "Unexpected order URL");
    ok &= Expect(request.headers.at("Content-Type") == "application/json", "JSON content type expected");

    const auto body = nlohmann::ordered_json::parse(request.body);
    ok &= Expect(body.at("symbol") == "SOLUSDT.P", "symbol");
    ok &= Expect(body.at("side") == "Sell", "side");
    ok &= Expect(body.at("orderType") == "Market", "orderType");
    ok &= Expect(body.at("qty") == "20.927", "qty should be a string");
    ok &= Expect(body.at("timeInForce") == "GoodTillCancel", "timeInForce");
    ok &= Expect(body.at("apiKey") == "key-1", "apiKey");
    ok &= Expect(!body.at("timestamp").get<std::string>().empty(), "timestamp");
    security::Parameters signedPart;
    std::string lastKey;
    for (const auto& item : body.items()) {
        signedPart.emplace_back(item.key(), item.value().get<std::string>());
        lastKey = item.key();
    }
    ok &= Expect(lastKey == "sign", "sign must be the final member of the body");
    ok &= Expect(body.at("sign") == security::RequestSigner("secret-1").sign(signedPart),
                 "Order signature does not verify");
    return ok;
}

bool TestTransportFailurePropagates() {
    ScriptedTransport transport([](const exchange::HttpRequest&) -> exchange::HttpResponse {
        throw std::runtime_error("connection reset");
    });
    const trading::OrderExecutor executor("https://api.example.com", "key", "secret", transport.transport());
    try {
        executor.placeMarketOrder(trading::OrderSide::Buy, "SOLUSDT", 1.0);
    } catch (const std::runtime_error&) {
        return Expect(transport.requests().size() == 1, "Order must not be retried");
    }
    std::cerr << "Transport failure was swallowed" << std::endl;
    return false;
}

}  // namespace

int main() {
    if (!TestFormatQuantity()) {
        return 1;
    }
    if (!TestMarketOrderPayload()) {
        return 1;
    }
    if (!TestTransportFailurePropagates()) {
        return 1;
    }
    return 0;
}
