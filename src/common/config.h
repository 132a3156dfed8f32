#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "common/logging.h"

namespace common {

struct ExchangeCredentials {
    std::string api_key;
    std::string api_secret;
};

struct TelegramSettings {
    std::string bot_token;
    // Numeric id only; channels use their -100... id, not an @username.
    std::optional<std::int64_t> chat_id;

    bool enabled() const { return !bot_token.empty() && chat_id.has_value(); }
};

struct ServiceConfig {
    ExchangeCredentials credentials;
    TelegramSettings telegram;
    std::string base_url = "https://api.bybit.com";
    std::string symbol = "SOLUSDT.P";
    double leverage = 3.0;
    double slippage = 0.0035;
    std::uint16_t port = 8080;
    int dedup_retention_seconds = 60;
    LogLevel log_level = LogLevel::Info;
};

// Returns the value of an environment variable, or std::nullopt when unset.
using EnvironmentLookup = std::function<std::optional<std::string>(const std::string& name)>;

// Builds the service configuration from environment variables. Missing
// exchange credentials raise std::runtime_error; malformed numeric values
// raise std::invalid_argument naming the offending variable.
ServiceConfig loadConfigFromEnvironment(const EnvironmentLookup& lookup = {});

}  // namespace common
