#include "common/config.h"

#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace common {
namespace {

std::optional<std::string> processEnvironment(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
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

double parseDouble(const std::string& name, const std::string& raw) {
    try {
        std::size_t processed = 0;
        const double value = std::stod(raw, &processed);
        if (processed != raw.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return value;
    } catch (const std::exception&) {
        throw std::invalid_argument(name + " must be a number, got '" + raw + "'");
    }
}

long long parseInteger(const std::string& name, const std::string& raw) {
    try {
        std::size_t processed = 0;
        const long long value = std::stoll(raw, &processed);
        if (processed != raw.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return value;
    } catch (const std::exception&) {
        throw std::invalid_argument(name + " must be an integer, got '" + raw + "'");
    }
}

}  // namespace

ServiceConfig loadConfigFromEnvironment(const EnvironmentLookup& lookup) {
    const EnvironmentLookup env = lookup ? lookup : EnvironmentLookup(&processEnvironment);

    const auto read = [&env](const std::string& name) -> std::string {
        const auto value = env(name);
        return value ? trim(*value) : std::string();
    };

    ServiceConfig config;

    config.credentials.api_key = read("BYBIT_API_KEY");
    config.credentials.api_secret = read("BYBIT_SECRET");
    if (config.credentials.api_key.empty() || config.credentials.api_secret.empty()) {
        throw std::runtime_error("BYBIT_API_KEY and BYBIT_SECRET must be set");
    }

    config.telegram.bot_token = read("TELEGRAM_TOKEN");
    if (const auto chat = read("TELEGRAM_CHAT_ID"); !chat.empty()) {
        config.telegram.chat_id = parseInteger("TELEGRAM_CHAT_ID", chat);
    }

    if (auto base_url = read("BYBIT_BASE_URL"); !base_url.empty()) {
        while (!base_url.empty() && base_url.back() == '/') {
            base_url.pop_back();
        }
        config.base_url = base_url;
    }

    if (const auto symbol = read("TRADING_SYMBOL"); !symbol.empty()) {
        config.symbol = symbol;
    }

    if (const auto leverage = read("LEVERAGE"); !leverage.empty()) {
        config.leverage = parseDouble("LEVERAGE", leverage);
        if (config.leverage <= 0.0) {
            throw std::invalid_argument("LEVERAGE must be greater than zero");
        }
    }

    if (const auto slippage = read("SLIPPAGE"); !slippage.empty()) {
        config.slippage = parseDouble("SLIPPAGE", slippage);
        if (config.slippage < 0.0) {
            throw std::invalid_argument("SLIPPAGE must not be negative");
        }
    }

    if (const auto port = read("PORT"); !port.empty()) {
        const long long value = parseInteger("PORT", port);
        if (value < 1 || value > std::numeric_limits<std::uint16_t>::max()) {
            throw std::invalid_argument("PORT must be between 1 and 65535");
        }
        config.port = static_cast<std::uint16_t>(value);
    }

    if (const auto retention = read("DEDUP_RETENTION_SECONDS"); !retention.empty()) {
        const long long value = parseInteger("DEDUP_RETENTION_SECONDS", retention);
        if (value < 1 || value > std::numeric_limits<int>::max()) {
            throw std::invalid_argument("DEDUP_RETENTION_SECONDS must be at least 1");
        }
        config.dedup_retention_seconds = static_cast<int>(value);
    }

    if (const auto level = read("LOG_LEVEL"); !level.empty()) {
        config.log_level = parseLogLevel(level);
    }

    return config;
}

}  // namespace common
