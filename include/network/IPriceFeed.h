#pragma once

#include <string>
#include <vector>

#include "common/Types.h"
#include "market/SyntheticPriceSeries.h"

namespace papertrade {
namespace network {

// External USD price source. Every call throws std::runtime_error on failure.
class IPriceFeed {
public:
    virtual ~IPriceFeed() = default;

    virtual PriceTick spot(const std::string& asset) = 0;

    // Closes at granularity_seconds spacing inside [start_ms, end_ms], oldest first
    virtual std::vector<market::HistoryPoint> history(
        const std::string& asset, long long start_ms, long long end_ms, int granularity_seconds) = 0;

    // Candles inside [start_ms, end_ms], oldest first
    virtual std::vector<OhlcCandle> ohlc(
        const std::string& asset, long long start_ms, long long end_ms, int granularity_seconds) = 0;
};

} // namespace network
} // namespace papertrade
