#include "analytics/TechnicalIndicators.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

using papertrade::analytics::TechnicalIndicators;

namespace {
bool near(double a, double b, double eps = 1e-9) {
    return std::fabs(a - b) < eps;
}
}

int main() {
    std::cout << "[TEST] Starting Indicators Test..." << std::endl;

    // SMA
    {
        const std::vector<double> prices{1, 2, 3, 4, 5};
        auto sma = TechnicalIndicators::calculateSMA(prices, 3);
        assert(sma.size() == prices.size());
        assert(std::isnan(sma[0]) && std::isnan(sma[1]));
        assert(near(sma[2], 2.0));
        assert(near(sma[3], 3.0));
        assert(near(sma[4], 4.0));

        auto short_input = TechnicalIndicators::calculateSMA({1, 2}, 3);
        assert(short_input.size() == 2);
        assert(std::isnan(short_input[0]) && std::isnan(short_input[1]));
    }

    // EMA seeded with SMA, k = 2 / (period + 1)
    {
        const std::vector<double> prices{2, 4, 6, 8};
        auto ema = TechnicalIndicators::calculateEMA(prices, 3);
        assert(ema.size() == 4);
        assert(std::isnan(ema[0]) && std::isnan(ema[1]));
        assert(near(ema[2], 4.0));
        assert(near(ema[3], 8.0 * 0.5 + 4.0 * 0.5));
    }

    // SMA and EMA over the same reference series
    {
        const std::vector<double> prices{100, 102, 101, 103, 105, 104, 106};
        auto sma = TechnicalIndicators::calculateSMA(prices, 3);
        assert(sma.size() == 7);
        assert(std::isnan(sma[0]) && std::isnan(sma[1]));
        const double expected[] = {101, 102, 103, 104, 105};
        for (int i = 0; i < 5; ++i) {
            assert(near(sma[i + 2], expected[i]));
        }

        auto ema = TechnicalIndicators::calculateEMA(prices, 3);
        assert(ema.size() == 7);
        assert(std::isnan(ema[0]) && std::isnan(ema[1]));
        assert(near(ema[2], 101.0));
        assert(near(ema[3], 102.0));
    }

    // RSI: monotonic rise saturates at 100, warmup is NaN
    {
        std::vector<double> rising;
        for (int i = 0; i < 20; ++i) rising.push_back(100.0 + i);
        auto rsi = TechnicalIndicators::calculateRSI(rising, 14);
        assert(rsi.size() == rising.size());
        for (int i = 0; i < 14; ++i) assert(std::isnan(rsi[i]));
        assert(near(rsi[14], 100.0));
        assert(near(rsi[19], 100.0));

        std::vector<double> falling;
        for (int i = 0; i < 20; ++i) falling.push_back(100.0 - i);
        auto rsi_down = TechnicalIndicators::calculateRSI(falling, 14);
        assert(near(rsi_down[14], 0.0));

        // period + 1 prices needed
        auto too_short = TechnicalIndicators::calculateRSI(std::vector<double>(14, 1.0), 14);
        for (double v : too_short) assert(std::isnan(v));
    }

    // RSI with mixed moves stays strictly between the bounds
    {
        const std::vector<double> prices{10, 11, 10, 12, 11};
        auto rsi = TechnicalIndicators::calculateRSI(prices, 2);
        // seed: gains (1 + 0) / 2 = 0.5, losses (0 + 1) / 2 = 0.5 -> 50
        assert(near(rsi[2], 50.0));
        // Wilder: gain 2 -> avg_gain 1.25, avg_loss 0.25 -> rs 5
        assert(near(rsi[3], 100.0 - 100.0 / 6.0));
        assert(rsi[4] > 0.0 && rsi[4] < 100.0);
    }

    // Named evaluation
    {
        std::vector<double> prices;
        for (int i = 0; i < 30; ++i) prices.push_back(50.0 + (i % 5));

        auto sma = TechnicalIndicators::evaluateNamed(prices, "sma_20");
        assert(sma.has_value());
        assert(sma->size() == prices.size());
        assert(std::isnan((*sma)[18]));
        assert(!std::isnan((*sma)[19]));

        assert(TechnicalIndicators::evaluateNamed(prices, "ema_12").has_value());
        assert(TechnicalIndicators::evaluateNamed(prices, "rsi_14").has_value());
        assert(TechnicalIndicators::evaluateNamed(prices, "SMA_5").has_value());

        assert(!TechnicalIndicators::evaluateNamed(prices, "sma").has_value());
        assert(!TechnicalIndicators::evaluateNamed(prices, "sma_").has_value());
        assert(!TechnicalIndicators::evaluateNamed(prices, "sma_x").has_value());
        assert(!TechnicalIndicators::evaluateNamed(prices, "sma_1").has_value());
        assert(!TechnicalIndicators::evaluateNamed(prices, "sma_201").has_value());
        assert(!TechnicalIndicators::evaluateNamed(prices, "macd_12").has_value());
        assert(!TechnicalIndicators::evaluateNamed(prices, "sma_20_1").has_value());
        assert(TechnicalIndicators::evaluateNamed(prices, "sma_200").has_value());
    }

    std::cout << "[TEST] Indicators Test PASSED!" << std::endl;
    return 0;
}
