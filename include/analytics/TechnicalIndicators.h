#pragma once

#include <optional>
#include <string>
#include <vector>
#include "common/Types.h"

namespace papertrade {
namespace analytics {

// Series indicators. Every result has the same length as the input and marks
// warmup positions with NaN.
class TechnicalIndicators {
public:
    // SMA - arithmetic mean of the trailing `period` prices
    static std::vector<double> calculateSMA(const std::vector<double>& prices, int period);

    // EMA - seeded with the SMA of the first `period` prices, k = 2 / (period + 1)
    static std::vector<double> calculateEMA(const std::vector<double>& prices, int period);

    // RSI with Wilder smoothing. Needs period + 1 prices; first `period` entries are NaN.
    // 70 and above: overbought, 30 and below: oversold
    static std::vector<double> calculateRSI(const std::vector<double>& prices, int period = 14);

    // Named indicator such as "sma_20", "ema_12" or "rsi_14".
    // Returns nullopt for an unknown kind or a period outside [2, 200].
    static std::optional<std::vector<double>> evaluateNamed(const std::vector<double>& prices,
                                                            const std::string& name);

    static std::vector<double> extractPrices(const std::vector<PriceTick>& ticks);

    static constexpr int MIN_NAMED_PERIOD = 2;
    static constexpr int MAX_NAMED_PERIOD = 200;
};

} // namespace analytics
} // namespace papertrade
