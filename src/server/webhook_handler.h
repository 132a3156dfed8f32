#pragma once

#include <chrono>
#include <functional>
#include <string>

#include "market_data/bybit_market_client.h"
#include "telegram/notification_sink.h"
#include "trading/duplicate_suppressor.h"
#include "trading/order_executor.h"
#include "trading/position_sizer.h"

namespace server {

struct InboundRequest {
    std::string method;
    std::string target;
    std::string body;
};

struct HttpReply {
    int status{200};
    std::string contentType{"application/json"};
    std::string body;
};

// Maps a strategy label onto a weight-table key. "ENTRY LONG STEP 1" becomes
// "Long 1"; labels without STEP, or with STEP but no direction, fall back to
// the explicit order id. Matching is case-insensitive on the label.
std::string resolveOrderId(const std::string& signal, const std::string& explicitOrderId);

// WebhookHandler owns the per-request flow: validate the alert, gate it
// through the duplicate suppressor, size it from fresh balance and price,
// submit the order and report the outcome. Every collaborator is borrowed and
// must outlive the handler. handle() is safe to call from many threads.
class WebhookHandler {
public:
    using Clock = std::chrono::system_clock;
    using ClockFunction = std::function<Clock::time_point()>;

    WebhookHandler(const market_data::BybitMarketClient& marketClient,
                   const trading::PositionSizer& sizer,
                   trading::DuplicateSuppressor& suppressor,
                   const trading::OrderExecutor& executor,
                   telegram::NotificationSink& notifier,
                   ClockFunction clock = {});

    HttpReply handle(const InboundRequest& request) const;

    HttpReply handleWebhook(const std::string& body) const;
    HttpReply handleHome() const;
    HttpReply handlePing() const;

private:
    static HttpReply jsonReply(int status, const std::string& key, const std::string& value);

    std::string formatExecutionSummary(trading::OrderSide side,
                                       const std::string& orderId,
                                       double quantity,
                                       double price,
                                       Clock::time_point when) const;

    const market_data::BybitMarketClient& marketClient_;
    const trading::PositionSizer& sizer_;
    trading::DuplicateSuppressor& suppressor_;
    const trading::OrderExecutor& executor_;
    telegram::NotificationSink& notifier_;
    ClockFunction clock_;
};

}  // namespace server
