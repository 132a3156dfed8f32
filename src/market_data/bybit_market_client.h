#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "exchange/http_transport.h"
#include "security/request_signer.h"
#include "telegram/notification_sink.h"

namespace market_data {

class BybitMarketClientTestPeer;

// BybitMarketClient reads the two figures order sizing needs: the unified
// account's tradeable USDT and the instrument's last traded price. Both calls
// are single-attempt. Failures never escape: they are logged, reported to the
// notification sink and collapsed into a sentinel the caller must check.
class BybitMarketClient {
 public:
  static constexpr const char* kQuoteAsset = "USDT";

  BybitMarketClient(std::string base_url,
                    std::string symbol,
                    std::string api_key,
                    std::string api_secret,
                    exchange::HttpTransport transport,
                    telegram::NotificationSink& notifier);

  // Available-to-trade USDT. 0.0 means "fetch failed, abort the attempt".
  double fetchBalance() const;

  // Last traded price. std::nullopt on any failure or a non-positive price.
  std::optional<double> fetchPrice() const;

  const std::string& symbol() const { return symbol_; }

 private:
  friend class BybitMarketClientTestPeer;

  double requestBalance() const;
  double requestPrice() const;

  static double parseBalance(const nlohmann::json& json);
  static double parsePrice(const nlohmann::json& json);

  std::string base_url_;
  std::string symbol_;
  std::string api_key_;
  security::RequestSigner signer_;
  exchange::HttpTransport transport_;
  telegram::NotificationSink& notifier_;
};

// Accepts a finite JSON number or numeric string; throws std::runtime_error otherwise.
double parseDecimal(const nlohmann::json& value, const std::string& field);

}  // namespace market_data
