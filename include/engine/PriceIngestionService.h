#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio/steady_timer.hpp>

#include "engine/EngineConfig.h"
#include "engine/SharedState.h"
#include "engine/TaskRuntime.h"
#include "market/CandleAccumulator.h"
#include "network/IPriceFeed.h"

namespace papertrade {
namespace engine {

struct BackfillReport {
    std::string asset;
    std::size_t raw_ticks = 0;
    std::size_t five_minute_points = 0;
    std::size_t one_minute_candles = 0;
    std::size_t five_minute_candles = 0;
    bool synthetic = false;             // raw tier seeded from the synthetic series
    bool derived_ohlc = false;          // at least one OHLC tier rebuilt from raw ticks
};

// One strand-bound polling loop per asset: backfill once, then fetch the spot
// price every poll interval and roll it into the candle tiers.
class PriceIngestionService {
public:
    PriceIngestionService(SharedState& state,
                          std::shared_ptr<network::IPriceFeed> feed,
                          TaskRuntime& runtime,
                          const MarketConfig& market_config,
                          const FeedConfig& feed_config);

    void start();
    void stop();

    // Synchronous building blocks of the loop. Safe to call from tests without
    // starting the runtime.
    BackfillReport backfill(const std::string& asset, long long now_ms);
    bool pollOnce(const std::string& asset);

    std::vector<std::string> assets() const;
    std::size_t pollCount(const std::string& asset) const;
    std::size_t failureCount(const std::string& asset) const;

private:
    struct AssetTask {
        std::string asset;
        TaskRuntime::Strand strand;
        boost::asio::steady_timer timer;
        market::CandleAccumulator one_minute;
        market::CandleAccumulator five_minute;
        std::atomic<std::size_t> polls{0};
        std::atomic<std::size_t> failures{0};

        AssetTask(const std::string& a, TaskRuntime::Strand s, int ticks_1m, int ticks_5m)
            : asset(a)
            , strand(s)
            , timer(s)
            , one_minute(a, ticks_1m)
            , five_minute(a, ticks_5m)
        {}
    };

    void scheduleNext(AssetTask& task);
    AssetTask* find(const std::string& asset) const;

    std::vector<PriceTick> backfillRaw(const std::string& asset, long long now_ms, bool& synthetic);
    std::vector<OhlcCandle> fetchOhlc(const std::string& asset, long long start_ms, long long now_ms,
                                      int granularity_seconds);

    SharedState& state_;
    std::shared_ptr<network::IPriceFeed> feed_;
    TaskRuntime& runtime_;
    MarketConfig market_config_;
    FeedConfig feed_config_;
    std::map<std::string, std::unique_ptr<AssetTask>> tasks_;
    std::atomic<bool> stopping_{false};
};

} // namespace engine
} // namespace papertrade
