#include "server/webhook_handler.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <exception>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "common/logging.h"

namespace server {
namespace {
constexpr const char* kStepToken = "STEP";
constexpr const char* kHomeText = "Bybit webhook trading server is running";

std::string toUpper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    const auto b = s.find_first_not_of(ws);
    const auto e = s.find_last_not_of(ws);
    if (b == std::string::npos) {
        return "";
    }
    return s.substr(b, e - b + 1);
}

std::string stringField(const nlohmann::json& object, const char* key) {
    const auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

// Bybit's retCode. Absent, null or non-integer values count as success (0);
// a numeric string is accepted.
std::int64_t integerField(const nlohmann::json& object, const char* key) {
    if (!object.is_object()) {
        return 0;
    }
    const auto it = object.find(key);
    if (it == object.end()) {
        return 0;
    }
    if (it->is_number_integer()) {
        return it->get<std::int64_t>();
    }
    if (it->is_string()) {
        const auto& text = it->get_ref<const std::string&>();
        std::int64_t value = 0;
        const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec == std::errc() && end == text.data() + text.size()) {
            return value;
        }
    }
    return 0;
}

std::string stripQuery(const std::string& target) {
    const auto query = target.find('?');
    return query == std::string::npos ? target : target.substr(0, query);
}
}  // namespace

std::string resolveOrderId(const std::string& signal, const std::string& explicitOrderId) {
    const std::string label = toUpper(signal);
    const auto step = label.rfind(kStepToken);
    if (step == std::string::npos) {
        return explicitOrderId;
    }

    const std::string stepNumber = trim(label.substr(step + std::char_traits<char>::length(kStepToken)));
    if (label.find("LONG") != std::string::npos) {
        return "Long " + stepNumber;
    }
    if (label.find("SHORT") != std::string::npos) {
        return "Short " + stepNumber;
    }
    return explicitOrderId;
}

WebhookHandler::WebhookHandler(const market_data::BybitMarketClient& marketClient,
                               const trading::PositionSizer& sizer,
                               trading::DuplicateSuppressor& suppressor,
                               const trading::OrderExecutor& executor,
                               telegram::NotificationSink& notifier,
                               ClockFunction clock)
    : marketClient_(marketClient),
      sizer_(sizer),
      suppressor_(suppressor),
      executor_(executor),
      notifier_(notifier),
      clock_(clock ? std::move(clock) : ClockFunction([]() { return Clock::now(); })) {}

HttpReply WebhookHandler::handle(const InboundRequest& request) const {
    const std::string path = stripQuery(request.target);

    if (path == "/webhook") {
        if (request.method != "POST") {
            return jsonReply(405, "error", "Method not allowed");
        }
        return handleWebhook(request.body);
    }
    if (path == "/" || path == "/ping") {
        if (request.method != "GET" && request.method != "HEAD") {
            return jsonReply(405, "error", "Method not allowed");
        }
        return path == "/" ? handleHome() : handlePing();
    }
    return jsonReply(404, "error", "Not found");
}

HttpReply WebhookHandler::handleHome() const {
    HttpReply reply;
    reply.contentType = "text/plain; charset=utf-8";
    reply.body = kHomeText;
    return reply;
}

HttpReply WebhookHandler::handlePing() const {
    const std::chrono::duration<double> sinceEpoch = clock_().time_since_epoch();
    nlohmann::json body = {{"status", "alive"}, {"time", sinceEpoch.count()}};

    HttpReply reply;
    reply.body = body.dump();
    return reply;
}

HttpReply WebhookHandler::handleWebhook(const std::string& body) const {
    nlohmann::json alert;
    try {
        alert = nlohmann::json::parse(body);
    } catch (const nlohmann::json::exception& ex) {
        LOG_WARN(std::string("Rejected webhook with malformed JSON: ") + ex.what());
        return jsonReply(400, "error", "Invalid JSON");
    }
    if (!alert.is_object()) {
        LOG_WARN("Rejected webhook whose body is not a JSON object");
        return jsonReply(400, "error", "Invalid JSON");
    }

    LOG_INFO("Webhook received: " + alert.dump());

    const std::string action = toLower(trim(stringField(alert, "order_action")));
    const std::string orderId = resolveOrderId(stringField(alert, "signal"), stringField(alert, "order_id"));

    if (action.empty() || orderId.empty() || (action != "buy" && action != "sell")) {
        LOG_WARN("Rejected webhook: order_action='" + action + "' order_id='" + orderId + "'");
        return jsonReply(400, "error", "Invalid webhook data");
    }
    const trading::OrderSide side = action == "buy" ? trading::OrderSide::Buy : trading::OrderSide::Sell;

    if (suppressor_.checkAndMark(orderId, clock_())) {
        LOG_INFO("Skipping duplicate alert for " + orderId);
        return jsonReply(200, "status", orderId + " skipped (duplicate second)");
    }

    const double balance = marketClient_.fetchBalance();
    if (balance == 0.0) {
        return jsonReply(500, "error", "Insufficient balance or failed to fetch");
    }

    const auto price = marketClient_.fetchPrice();
    if (!price) {
        return jsonReply(500, "error", "Price fetch failed");
    }

    const double quantity = sizer_.calculateQuantity(orderId, balance, *price);
    const auto now = clock_();
    std::ostringstream sizing;
    sizing << "Order " << orderId << ": qty " << trading::formatQuantity(quantity) << " (balance "
           << balance << " USDT, price " << *price << ")";
    LOG_INFO(sizing.str());

    try {
        const exchange::HttpResponse response =
            executor_.placeMarketOrder(side, marketClient_.symbol(), quantity);
        LOG_INFO("Order response: " + std::to_string(response.status_code) + " - " + response.body);

        if (response.status_code >= 400) {
            throw std::runtime_error("exchange returned HTTP " + std::to_string(response.status_code));
        }
        const nlohmann::json result = nlohmann::json::parse(response.body);

        const std::int64_t retCode = integerField(result, "retCode");
        if (retCode != 0) {
            std::string reason = stringField(result, "retMsg");
            if (reason.empty()) {
                reason = "unknown reason";
            }
            LOG_WARN("Exchange rejected order for " + orderId + ": " + reason);
            notifier_.notify("⚠️ Order rejected (retCode " + std::to_string(retCode) + "): " + reason);
        } else {
            notifier_.notify(formatExecutionSummary(side, orderId, quantity, *price, now));
        }

        HttpReply reply;
        reply.body = response.body;
        return reply;
    } catch (const std::exception& ex) {
        LOG_ERROR(std::string("Order failed: ") + ex.what());
        notifier_.notify(std::string("❌ Order failed: ") + ex.what());
        return jsonReply(500, "error", "Order request failed");
    }
}

HttpReply WebhookHandler::jsonReply(int status, const std::string& key, const std::string& value) {
    HttpReply reply;
    reply.status = status;
    reply.body = nlohmann::json{{key, value}}.dump();
    return reply;
}

std::string WebhookHandler::formatExecutionSummary(trading::OrderSide side,
                                                   const std::string& orderId,
                                                   double quantity,
                                                   double price,
                                                   Clock::time_point when) const {
    std::ostringstream oss;
    oss << "✅ Order placed: " << toUpper(trading::toString(side)) << ' '
        << trading::formatQuantity(quantity) << ' ' << marketClient_.symbol() << '\n';
    oss << "📊 Weight: " << std::fixed << std::setprecision(0) << sizer_.weightFor(orderId) * 100.0
        << "% | Price: " << std::setprecision(3) << price << " USDT\n";
    oss << "💰 Notional: " << std::setprecision(2) << quantity * price << " USDT | ⏰ Time: "
        << common::formatLocalTime(when);
    return oss.str();
}

}  // namespace server
