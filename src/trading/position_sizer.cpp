#include "trading/position_sizer.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace trading {

double roundToDecimals(double value, int decimals) {
    const double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

PositionSizer::PositionSizer(SizingParameters parameters, WeightTable weights)
    : parameters_(parameters), weights_(std::move(weights)) {
    if (parameters_.leverage <= 0.0) {
        throw std::invalid_argument("Leverage must be greater than zero");
    }
    if (parameters_.slippage < 0.0) {
        throw std::invalid_argument("Slippage tolerance must not be negative");
    }
    for (const auto& [orderId, weight] : weights_) {
        if (weight < 0.0) {
            throw std::invalid_argument("Negative weight configured for " + orderId);
        }
    }
}

WeightTable PositionSizer::defaultWeights() {
    return {
        {"Long 1", 0.70},
        {"Long 2", 0.10},
        {"Long 3", 0.10},
        {"Long 4", 0.10},
        {"Short 1", 0.30},
        {"Short 2", 0.40},
        {"Short 3", 0.20},
        {"Short 4", 0.10},
    };
}

double PositionSizer::weightFor(const std::string& orderId) const {
    const auto it = weights_.find(orderId);
    return it == weights_.end() ? 0.0 : it->second;
}

double PositionSizer::calculateQuantity(const std::string& orderId, double balance, double price) const {
    const double notional = std::max(balance, 0.0) * weightFor(orderId) * parameters_.leverage;
    const double quantity = notional / (price * (1.0 + parameters_.slippage));
    return std::max(roundToDecimals(quantity, kQuantityDecimals), 0.0);
}

}  // namespace trading
