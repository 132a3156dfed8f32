#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

#include "common/config.h"
#include "common/logging.h"
#include "exchange/http_transport.h"
#include "market_data/bybit_market_client.h"
#include "server/http_server.h"
#include "server/webhook_handler.h"
#include "telegram/notification_sink.h"
#include "telegram/telegram_notifier.h"
#include "trading/duplicate_suppressor.h"
#include "trading/order_executor.h"
#include "trading/position_sizer.h"

namespace {
server::HttpServer* g_server = nullptr;

void handleShutdownSignal(int) {
    if (g_server != nullptr) {
        g_server->stop();
    }
}
}  // namespace

int main() {
    common::ServiceConfig config;
    try {
        config = common::loadConfigFromEnvironment();
    } catch (const std::exception& ex) {
        std::cerr << "Configuration error: " << ex.what() << std::endl;
        return 1;
    }
    common::Logger::instance().setMinimumLevel(config.log_level);

    try {
        exchange::CurlHttpTransport curl;

        std::unique_ptr<telegram::TelegramNotifier> telegramNotifier;
        telegram::LogNotifier logNotifier;
        telegram::NotificationSink* notifier = &logNotifier;
        if (config.telegram.enabled()) {
            telegramNotifier = std::make_unique<telegram::TelegramNotifier>(config.telegram.bot_token,
                                                                            *config.telegram.chat_id);
            telegramNotifier->start();
            notifier = telegramNotifier.get();
        } else {
            LOG_WARN("TELEGRAM_TOKEN/TELEGRAM_CHAT_ID not set; notifications are only logged");
        }

        market_data::BybitMarketClient marketClient(config.base_url, config.symbol, config.credentials.api_key,
                                                    config.credentials.api_secret, curl.asTransport(), *notifier);
        trading::PositionSizer sizer({config.leverage, config.slippage});
        trading::DuplicateSuppressor suppressor(std::chrono::seconds(config.dedup_retention_seconds));
        trading::OrderExecutor executor(config.base_url, config.credentials.api_key,
                                        config.credentials.api_secret, curl.asTransport());

        server::WebhookHandler handler(marketClient, sizer, suppressor, executor, *notifier);
        server::HttpServer httpServer("0.0.0.0", config.port, handler);

        g_server = &httpServer;
        std::signal(SIGINT, handleShutdownSignal);
        std::signal(SIGTERM, handleShutdownSignal);

        LOG_INFO("Trading " + config.symbol + " with leverage " + std::to_string(config.leverage) +
                 " and slippage " + std::to_string(config.slippage));
        httpServer.run();
        g_server = nullptr;

        if (telegramNotifier) {
            telegramNotifier->stop();
        }
    } catch (const std::exception& ex) {
        LOG_ERROR(std::string("Fatal: ") + ex.what());
        return 1;
    }
    return 0;
}
