#include "market/CandleAccumulator.h"

#include <algorithm>
#include <stdexcept>

namespace papertrade {
namespace market {

CandleAccumulator::CandleAccumulator(std::string asset, int ticks_per_candle)
    : asset_(std::move(asset))
    , ticks_per_candle_(ticks_per_candle)
    , ticks_in_period_(0)
    , period_start_ms_(0)
    , open_(0)
    , high_(0)
    , low_(0)
    , close_(0)
{
    if (ticks_per_candle_ <= 0) {
        throw std::invalid_argument("ticks_per_candle must be positive");
    }
}

std::optional<OhlcCandle> CandleAccumulator::add(const PriceTick& tick) {
    if (ticks_in_period_ == 0) {
        period_start_ms_ = tick.timestamp_ms;
        open_ = tick.price;
        high_ = tick.price;
        low_ = tick.price;
    } else {
        high_ = std::max(high_, tick.price);
        low_ = std::min(low_, tick.price);
    }
    close_ = tick.price;
    ++ticks_in_period_;

    if (ticks_in_period_ < ticks_per_candle_) {
        return std::nullopt;
    }

    OhlcCandle closed(period_start_ms_, asset_, open_, high_, low_, close_);
    reset();
    return closed;
}

void CandleAccumulator::reset() {
    ticks_in_period_ = 0;
    period_start_ms_ = 0;
    open_ = high_ = low_ = close_ = 0.0;
}

} // namespace market
} // namespace papertrade
