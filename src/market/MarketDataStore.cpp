#include "market/MarketDataStore.h"
#include "common/Logger.h"

#include <cmath>

namespace papertrade {
namespace market {

namespace {
bool isUsablePrice(double price) {
    return std::isfinite(price) && price > 0.0;
}
}

MarketDataStore::MarketDataStore(const MarketDataCapacity& capacity)
    : capacity_(capacity)
    , raw_ticks_(capacity.raw_ticks)
    , five_minute_points_(capacity.five_minute_points)
    , one_minute_candles_(capacity.one_minute_candles)
    , five_minute_candles_(capacity.five_minute_candles)
{}

bool MarketDataStore::ingest(const PriceTick& tick, PriceResolution resolution) {
    if (tick.asset.empty() || !isUsablePrice(tick.price)) {
        LOG_WARN("Rejected {} tick for '{}' with price {}", toString(resolution), tick.asset, tick.price);
        return false;
    }
    series(resolution).push(tick);
    return true;
}

bool MarketDataStore::ingestOhlc(const OhlcCandle& candle, CandleInterval interval) {
    if (candle.asset.empty() || !isUsablePrice(candle.close) ||
        !isUsablePrice(candle.open) || candle.low > candle.high) {
        LOG_WARN("Rejected {} candle for '{}'", toString(interval), candle.asset);
        return false;
    }
    candleSeries(interval).push(candle);
    return true;
}

std::optional<double> MarketDataStore::latestPrice(const std::string& asset) const {
    const PriceTick* tick = raw_ticks_.latest(asset);
    if (!tick) {
        return std::nullopt;
    }
    return tick->price;
}

std::optional<double> MarketDataStore::pairPrice(const std::string& base, const std::string& quote) const {
    if (quote == REFERENCE_ASSET) {
        return latestPrice(base);
    }

    const auto quote_price = latestPrice(quote);
    if (!quote_price || *quote_price <= 0.0) {
        return std::nullopt;
    }

    if (base == REFERENCE_ASSET) {
        return 1.0 / *quote_price;
    }

    const auto base_price = latestPrice(base);
    if (!base_price) {
        return std::nullopt;
    }
    return *base_price / *quote_price;
}

std::vector<PriceTick> MarketDataStore::window(const std::string& asset, std::size_t limit,
                                               PriceResolution resolution) const {
    return series(resolution).last(asset, limit);
}

std::vector<OhlcCandle> MarketDataStore::candles(const std::string& asset, std::size_t limit,
                                                 CandleInterval interval) const {
    return candleSeries(interval).last(asset, limit);
}

std::size_t MarketDataStore::count(const std::string& asset, PriceResolution resolution) const {
    return series(resolution).count(asset);
}

std::size_t MarketDataStore::candleCount(const std::string& asset, CandleInterval interval) const {
    return candleSeries(interval).count(asset);
}

std::vector<std::string> MarketDataStore::assets() const {
    return raw_ticks_.assets();
}

BoundedSeries<PriceTick>& MarketDataStore::series(PriceResolution resolution) {
    return resolution == PriceResolution::RAW ? raw_ticks_ : five_minute_points_;
}

const BoundedSeries<PriceTick>& MarketDataStore::series(PriceResolution resolution) const {
    return resolution == PriceResolution::RAW ? raw_ticks_ : five_minute_points_;
}

BoundedSeries<OhlcCandle>& MarketDataStore::candleSeries(CandleInterval interval) {
    return interval == CandleInterval::ONE_MINUTE ? one_minute_candles_ : five_minute_candles_;
}

const BoundedSeries<OhlcCandle>& MarketDataStore::candleSeries(CandleInterval interval) const {
    return interval == CandleInterval::ONE_MINUTE ? one_minute_candles_ : five_minute_candles_;
}

const char* toString(PriceResolution resolution) {
    switch (resolution) {
        case PriceResolution::RAW: return "raw";
        case PriceResolution::FIVE_MINUTE: return "5m";
    }
    return "raw";
}

const char* toString(CandleInterval interval) {
    switch (interval) {
        case CandleInterval::ONE_MINUTE: return "1m";
        case CandleInterval::FIVE_MINUTE: return "5m";
    }
    return "1m";
}

} // namespace market
} // namespace papertrade
