#include "market_data/bybit_market_client.h"

#include <cmath>
#include <stdexcept>
#include <utility>

#include "common/logging.h"
#include "exchange/bybit_api.h"

namespace market_data {
namespace {
nlohmann::json parseJsonOrThrow(const std::string& payload, const std::string& context) {
  try {
    return nlohmann::json::parse(payload);
  } catch (const nlohmann::json::exception& ex) {
    const std::string snippet = payload.size() > 256 ? payload.substr(0, 256) + "..." : payload;
    throw std::runtime_error("Failed to parse " + context +
                             " response: " + std::string(ex.what()) + " (payload snippet: " + snippet + ")");
  }
}

void ensureSuccessStatus(const exchange::HttpResponse& response) {
  if (response.status_code >= 400) {
    throw std::runtime_error("HTTP error " + std::to_string(response.status_code) + ": " + response.body);
  }
}

// First element of result.list, as every v5 list endpoint returns it.
const nlohmann::json& firstListEntry(const nlohmann::json& json) {
  const auto result = json.find("result");
  if (result == json.end() || !result->is_object()) {
    throw std::runtime_error("response has no result object (retMsg: " +
                             (json.is_object() ? json.value("retMsg", std::string("n/a")) : std::string("n/a")) + ")");
  }
  const auto list = result->find("list");
  if (list == result->end() || !list->is_array() || list->empty()) {
    throw std::runtime_error("response result.list is empty");
  }
  return list->front();
}

nlohmann::json fieldOrNull(const nlohmann::json& object, const char* key) {
  const auto it = object.find(key);
  return it == object.end() ? nlohmann::json() : *it;
}
}  // namespace

double parseDecimal(const nlohmann::json& value, const std::string& field) {
  if (value.is_number()) {
    const double number = value.get<double>();
    if (!std::isfinite(number)) {
      throw std::runtime_error(field + " is not finite");
    }
    return number;
  }
  if (value.is_string()) {
    const auto& text = value.get_ref<const std::string&>();
    std::size_t processed = 0;
    double parsed = 0.0;
    try {
      parsed = std::stod(text, &processed);
    } catch (const std::exception&) {
      processed = 0;
    }
    // stod also accepts "nan" and "inf".
    if (processed == 0 || processed != text.size() || !std::isfinite(parsed)) {
      throw std::runtime_error(field + " is not numeric: '" + text + "'");
    }
    return parsed;
  }
  throw std::runtime_error(field + " is missing or not numeric");
}

BybitMarketClient::BybitMarketClient(std::string base_url,
                                     std::string symbol,
                                     std::string api_key,
                                     std::string api_secret,
                                     exchange::HttpTransport transport,
                                     telegram::NotificationSink& notifier)
    : base_url_(exchange::normalizeBaseUrl(std::move(base_url))),
      symbol_(std::move(symbol)),
      api_key_(std::move(api_key)),
      signer_(std::move(api_secret)),
      transport_(std::move(transport)),
      notifier_(notifier) {
  if (!transport_) {
    throw std::invalid_argument("BybitMarketClient requires an HTTP transport");
  }
  if (symbol_.empty()) {
    throw std::invalid_argument("BybitMarketClient requires a symbol");
  }
}

double BybitMarketClient::fetchBalance() const {
  try {
    return requestBalance();
  } catch (const std::exception& ex) {
    LOG_ERROR(std::string("Balance fetch failed: ") + ex.what());
    notifier_.notify(std::string("❌ Balance fetch failed: ") + ex.what());
    return 0.0;
  }
}

std::optional<double> BybitMarketClient::fetchPrice() const {
  try {
    return requestPrice();
  } catch (const std::exception& ex) {
    LOG_ERROR(std::string("Price fetch failed: ") + ex.what());
    notifier_.notify(std::string("❌ Price fetch failed: ") + ex.what());
    return std::nullopt;
  }
}

double BybitMarketClient::requestBalance() const {
  exchange::HttpRequest request;
  request.method = exchange::HttpMethod::Get;
  request.url = base_url_ + exchange::kWalletBalancePath;
  request.query_params = signer_.signParameters({
      {"apiKey", api_key_},
      {"timestamp", exchange::timestampMillis()},
      {"accountType", "UNIFIED"},
  });
  request.headers["Content-Type"] = "application/json";
  request.timeout = exchange::kAccountTimeout;

  const exchange::HttpResponse response = transport_(request);
  ensureSuccessStatus(response);
  return parseBalance(parseJsonOrThrow(response.body, "wallet balance"));
}

double BybitMarketClient::requestPrice() const {
  exchange::HttpRequest request;
  request.method = exchange::HttpMethod::Get;
  request.url = base_url_ + exchange::kTickersPath;
  request.query_params = {{"category", "linear"}, {"symbol", symbol_}};
  request.timeout = exchange::kTickerTimeout;

  const exchange::HttpResponse response = transport_(request);
  ensureSuccessStatus(response);
  return parsePrice(parseJsonOrThrow(response.body, "ticker"));
}

double BybitMarketClient::parseBalance(const nlohmann::json& json) {
  const auto& account = firstListEntry(json);
  const auto coins = account.find("coin");
  if (coins == account.end() || !coins->is_array()) {
    throw std::runtime_error("account entry has no coin list");
  }

  for (const auto& coin : *coins) {
    if (coin.value("coin", std::string()) != kQuoteAsset) {
      continue;
    }
    const double available = parseDecimal(fieldOrNull(coin, "availableToTrade"), "availableToTrade");
    if (available < 0.0) {
      throw std::runtime_error("availableToTrade is negative");
    }
    return available;
  }
  throw std::runtime_error(std::string("no ") + kQuoteAsset + " entry in coin list");
}

double BybitMarketClient::parsePrice(const nlohmann::json& json) {
  const auto& ticker = firstListEntry(json);
  const double price = parseDecimal(fieldOrNull(ticker, "lastPrice"), "lastPrice");
  if (!(price > 0.0)) {
    throw std::runtime_error("lastPrice is not positive");
  }
  return price;
}

}  // namespace market_data
