#include "market/CandleAccumulator.h"
#include "market/SyntheticPriceSeries.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>

using namespace papertrade;
using market::CandleAccumulator;
using market::SyntheticPriceSeries;

int main() {
    std::cout << "[TEST] Starting CandleAccumulator Test..." << std::endl;

    // One candle per 12 ticks
    {
        CandleAccumulator acc("BTC", 12);
        const double prices[12] = {100, 103, 99, 101, 105, 104, 98, 100, 102, 101, 100, 102};

        for (int i = 0; i < 11; ++i) {
            assert(!acc.add(PriceTick(1000 + i * 5000, "BTC", prices[i])).has_value());
        }
        assert(acc.hasOpenPeriod());
        assert(acc.ticksInPeriod() == 11);

        auto candle = acc.add(PriceTick(1000 + 11 * 5000, "BTC", prices[11]));
        assert(candle.has_value());
        assert(candle->timestamp_ms == 1000);
        assert(candle->asset == "BTC");
        assert(candle->open == 100.0);
        assert(candle->high == 105.0);
        assert(candle->low == 98.0);
        assert(candle->close == 102.0);

        // Fresh period after close
        assert(!acc.hasOpenPeriod());
        assert(!acc.add(PriceTick(70000, "BTC", 50.0)).has_value());
        assert(acc.ticksInPeriod() == 1);
    }

    // Single-tick periods
    {
        CandleAccumulator acc("ETH", 1);
        auto c = acc.add(PriceTick(5, "ETH", 7.0));
        assert(c.has_value());
        assert(c->open == 7.0 && c->high == 7.0 && c->low == 7.0 && c->close == 7.0);
    }

    // Non-positive period length is rejected
    {
        bool threw = false;
        try {
            CandleAccumulator bad("BTC", 0);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }

    // Synthetic series: count, spacing and the closed-form price
    {
        const long long end_ms = 1700000000000LL;
        auto ticks = SyntheticPriceSeries::generate("BTC", 1000.0, end_ms, 720, 5);
        assert(ticks.size() == 720);
        assert(ticks.back().timestamp_ms == end_ms);
        assert(ticks.front().timestamp_ms == end_ms - 719LL * 5000);
        for (size_t i = 1; i < ticks.size(); ++i) {
            assert(ticks[i].timestamp_ms - ticks[i - 1].timestamp_ms == 5000);
        }
        // The newest point has i = 0: every sine term vanishes
        assert(std::fabs(ticks.back().price - 1000.0) < 1e-9);

        const double x = 719.0;
        const double expected = 1000.0 + std::sin(x / 100.0) * 10.0 + std::sin(x / 20.0) * 5.0 +
                                std::sin(x * 7.0) * 0.2;
        assert(std::fabs(ticks.front().price - expected) < 1e-9);

        assert(SyntheticPriceSeries::generate("BTC", 0.0, end_ms, 10, 5).empty());
    }

    // Interpolation of minute closes to 5s points
    {
        std::vector<market::HistoryPoint> points{{0, 100.0}, {60000, 112.0}, {120000, 100.0}};
        auto ticks = SyntheticPriceSeries::interpolate("BTC", points, 5);
        assert(ticks.size() == 25);
        assert(ticks[0].price == 100.0);
        assert(std::fabs(ticks[1].price - 101.0) < 1e-9);
        assert(ticks[12].timestamp_ms == 60000 && std::fabs(ticks[12].price - 112.0) < 1e-9);
        assert(ticks.back().timestamp_ms == 120000 && ticks.back().price == 100.0);

        assert(SyntheticPriceSeries::interpolate("BTC", {}, 5).empty());
        assert(SyntheticPriceSeries::interpolate("BTC", {{5, 3.0}}, 5).size() == 1);
    }

    std::cout << "[TEST] CandleAccumulator Test PASSED!" << std::endl;
    return 0;
}
