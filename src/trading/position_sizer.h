#pragma once

#include <map>
#include <string>

namespace trading {

// Fraction of the account balance committed per order identifier.
using WeightTable = std::map<std::string, double>;

struct SizingParameters {
    double leverage{3.0};
    double slippage{0.0035};
};

// Converts balance, weight and leverage into an instrument quantity. The
// price is padded by the slippage tolerance so the fill never needs more
// margin than the weight allows. Callers must pass a positive price.
class PositionSizer {
public:
    static constexpr int kQuantityDecimals = 3;

    explicit PositionSizer(SizingParameters parameters, WeightTable weights = defaultWeights());

    static WeightTable defaultWeights();

    // 0.0 for identifiers missing from the table.
    double weightFor(const std::string& orderId) const;

    double calculateQuantity(const std::string& orderId, double balance, double price) const;

    const SizingParameters& parameters() const { return parameters_; }

private:
    SizingParameters parameters_;
    const WeightTable weights_;
};

double roundToDecimals(double value, int decimals);

}  // namespace trading
