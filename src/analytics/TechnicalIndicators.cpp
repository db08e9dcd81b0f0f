#include "analytics/TechnicalIndicators.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace papertrade {
namespace analytics {

namespace {
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

double rsiFrom(double avg_gain, double avg_loss) {
    if (avg_loss == 0.0) {
        return 100.0;
    }
    const double rs = avg_gain / avg_loss;
    return 100.0 - (100.0 / (1.0 + rs));
}
}

std::vector<double> TechnicalIndicators::calculateSMA(const std::vector<double>& prices, int period) {
    std::vector<double> result(prices.size(), kNaN);
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) {
        return result;
    }

    for (size_t i = period - 1; i < prices.size(); ++i) {
        double window_sum = 0.0;
        for (size_t j = i + 1 - period; j <= i; ++j) {
            window_sum += prices[j];
        }
        result[i] = window_sum / period;
    }
    return result;
}

std::vector<double> TechnicalIndicators::calculateEMA(const std::vector<double>& prices, int period) {
    std::vector<double> result(prices.size(), kNaN);
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) {
        return result;
    }

    const double k = 2.0 / (period + 1.0);

    double seed = 0.0;
    for (int i = 0; i < period; ++i) {
        seed += prices[i];
    }
    result[period - 1] = seed / period;

    // EMA(t) = price(t) * k + EMA(t-1) * (1 - k)
    for (size_t i = period; i < prices.size(); ++i) {
        result[i] = prices[i] * k + result[i - 1] * (1.0 - k);
    }
    return result;
}

std::vector<double> TechnicalIndicators::calculateRSI(const std::vector<double>& prices, int period) {
    std::vector<double> result(prices.size(), kNaN);
    if (period <= 0 || prices.size() < static_cast<size_t>(period + 1)) {
        return result;
    }

    // Seed: simple mean over the first `period` deltas
    double avg_gain = 0.0;
    double avg_loss = 0.0;
    for (int i = 1; i <= period; ++i) {
        const double change = prices[i] - prices[i - 1];
        if (change > 0) avg_gain += change;
        else avg_loss += -change;
    }
    avg_gain /= period;
    avg_loss /= period;
    result[period] = rsiFrom(avg_gain, avg_loss);

    // Wilder smoothing for the rest
    for (size_t i = period + 1; i < prices.size(); ++i) {
        const double change = prices[i] - prices[i - 1];
        const double gain = (change > 0) ? change : 0.0;
        const double loss = (change < 0) ? -change : 0.0;

        avg_gain = ((avg_gain * (period - 1)) + gain) / period;
        avg_loss = ((avg_loss * (period - 1)) + loss) / period;
        result[i] = rsiFrom(avg_gain, avg_loss);
    }
    return result;
}

std::optional<std::vector<double>> TechnicalIndicators::evaluateNamed(
    const std::vector<double>& prices,
    const std::string& name
) {
    const auto sep = name.find('_');
    if (sep == std::string::npos || sep == 0 || sep + 1 >= name.size()) {
        return std::nullopt;
    }

    std::string kind = name.substr(0, sep);
    std::transform(kind.begin(), kind.end(), kind.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    const std::string period_text = name.substr(sep + 1);
    if (!std::all_of(period_text.begin(), period_text.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }

    int period = 0;
    try {
        period = std::stoi(period_text);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
    if (period < MIN_NAMED_PERIOD || period > MAX_NAMED_PERIOD) {
        return std::nullopt;
    }

    if (kind == "sma") return calculateSMA(prices, period);
    if (kind == "ema") return calculateEMA(prices, period);
    if (kind == "rsi") return calculateRSI(prices, period);
    return std::nullopt;
}

std::vector<double> TechnicalIndicators::extractPrices(const std::vector<PriceTick>& ticks) {
    std::vector<double> prices;
    prices.reserve(ticks.size());
    for (const auto& tick : ticks) {
        prices.push_back(tick.price);
    }
    return prices;
}

} // namespace analytics
} // namespace papertrade
