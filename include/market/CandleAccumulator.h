#pragma once

#include <optional>
#include <string>

#include "common/Types.h"

namespace papertrade {
namespace market {

// Live OHLC builder for one asset and one interval. Closes after a fixed
// number of ticks and starts a fresh period on the next tick.
class CandleAccumulator {
public:
    CandleAccumulator(std::string asset, int ticks_per_candle);

    // Returns the closed candle when this tick completes the period.
    std::optional<OhlcCandle> add(const PriceTick& tick);

    void reset();

    bool hasOpenPeriod() const { return ticks_in_period_ > 0; }
    int ticksInPeriod() const { return ticks_in_period_; }
    int ticksPerCandle() const { return ticks_per_candle_; }
    const std::string& asset() const { return asset_; }

private:
    std::string asset_;
    int ticks_per_candle_;
    int ticks_in_period_;
    long long period_start_ms_;
    double open_;
    double high_;
    double low_;
    double close_;
};

} // namespace market
} // namespace papertrade
