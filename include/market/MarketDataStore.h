#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "common/Types.h"
#include "market/BoundedSeries.h"

namespace papertrade {
namespace market {

enum class PriceResolution {
    RAW,            // one point per poll (5s)
    FIVE_MINUTE     // one close per 5-minute period
};

enum class CandleInterval {
    ONE_MINUTE,
    FIVE_MINUTE
};

struct MarketDataCapacity {
    std::size_t raw_ticks = 17280;
    std::size_t five_minute_points = 288;
    std::size_t one_minute_candles = 60;
    std::size_t five_minute_candles = 288;
};

// Bounded multi-resolution price history. Not synchronised: callers hold the
// shared state lock.
class MarketDataStore {
public:
    explicit MarketDataStore(const MarketDataCapacity& capacity = MarketDataCapacity());

    // Returns false when the tick carries a non-finite or non-positive price.
    bool ingest(const PriceTick& tick, PriceResolution resolution = PriceResolution::RAW);
    bool ingestOhlc(const OhlcCandle& candle, CandleInterval interval);

    std::optional<double> latestPrice(const std::string& asset) const;

    // Base priced in quote, triangulated through the reference asset when
    // neither leg is the reference.
    std::optional<double> pairPrice(const std::string& base, const std::string& quote) const;

    std::vector<PriceTick> window(const std::string& asset, std::size_t limit,
                                  PriceResolution resolution = PriceResolution::RAW) const;
    std::vector<OhlcCandle> candles(const std::string& asset, std::size_t limit,
                                    CandleInterval interval) const;

    std::size_t count(const std::string& asset, PriceResolution resolution) const;
    std::size_t candleCount(const std::string& asset, CandleInterval interval) const;
    std::vector<std::string> assets() const;

    const MarketDataCapacity& capacity() const { return capacity_; }

private:
    BoundedSeries<PriceTick>& series(PriceResolution resolution);
    const BoundedSeries<PriceTick>& series(PriceResolution resolution) const;
    BoundedSeries<OhlcCandle>& candleSeries(CandleInterval interval);
    const BoundedSeries<OhlcCandle>& candleSeries(CandleInterval interval) const;

    MarketDataCapacity capacity_;
    BoundedSeries<PriceTick> raw_ticks_;
    BoundedSeries<PriceTick> five_minute_points_;
    BoundedSeries<OhlcCandle> one_minute_candles_;
    BoundedSeries<OhlcCandle> five_minute_candles_;
};

const char* toString(PriceResolution resolution);
const char* toString(CandleInterval interval);

} // namespace market
} // namespace papertrade
