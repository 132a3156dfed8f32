#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace exchange {

// Bybit v5 REST paths used by the service.
constexpr const char* kWalletBalancePath = "/v5/account/wallet-balance";
constexpr const char* kTickersPath = "/v5/market/tickers";
constexpr const char* kCreateOrderPath = "/v5/order/create";

constexpr auto kAccountTimeout = std::chrono::seconds(10);
constexpr auto kTickerTimeout = std::chrono::seconds(5);
constexpr auto kOrderTimeout = std::chrono::seconds(10);

inline std::string timestampMillis() {
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

inline std::string normalizeBaseUrl(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

}  // namespace exchange
