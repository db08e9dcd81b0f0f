#include "engine/PriceIngestionService.h"
#include "engine/SharedState.h"
#include "engine/TaskRuntime.h"
#include "market/SyntheticPriceSeries.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <shared_mutex>
#include <stdexcept>

using namespace papertrade;
using market::CandleInterval;
using market::PriceResolution;

namespace {
constexpr long long kNow = 1700000000000LL;

// Scripted feed. Each endpoint can be switched to throw independently.
class FakePriceFeed : public network::IPriceFeed {
public:
    bool fail_spot = false;
    bool fail_history = false;
    bool fail_ohlc = false;
    double next_price = 100.0;
    double price_step = 1.0;
    long long next_ts = kNow;
    int zero_prices = 0;            // next N spots return 0.0

    PriceTick spot(const std::string& asset) override {
        if (fail_spot) {
            throw std::runtime_error("spot down");
        }
        if (zero_prices > 0) {
            --zero_prices;
            return PriceTick(next_ts, asset, 0.0);
        }
        PriceTick tick(next_ts, asset, next_price);
        next_price += price_step;
        next_ts += 5000;
        return tick;
    }

    std::vector<market::HistoryPoint> history(
        const std::string&, long long start_ms, long long end_ms, int granularity_seconds) override {
        if (fail_history) {
            throw std::runtime_error("history down");
        }
        std::vector<market::HistoryPoint> points;
        const long long step = granularity_seconds * 1000LL;
        for (long long t = start_ms; t <= end_ms; t += step) {
            points.push_back({t, 100.0 + static_cast<double>((t - start_ms) / step)});
        }
        return points;
    }

    std::vector<OhlcCandle> ohlc(
        const std::string& asset, long long start_ms, long long end_ms, int granularity_seconds) override {
        if (fail_ohlc) {
            throw std::runtime_error("ohlc down");
        }
        std::vector<OhlcCandle> candles;
        const long long step = granularity_seconds * 1000LL;
        for (long long t = start_ms; t < end_ms; t += step) {
            candles.emplace_back(t, asset, 100.0, 101.0, 99.0, 100.5);
        }
        return candles;
    }
};

struct Fixture {
    engine::SharedState state;
    engine::TaskRuntime runtime{1};
    std::shared_ptr<FakePriceFeed> feed = std::make_shared<FakePriceFeed>();
    engine::MarketConfig market_config;
    engine::PriceIngestionService service;

    Fixture()
        : service(state, feed, runtime, market_config, engine::FeedConfig())
    {}

    std::size_t count(const std::string& asset, PriceResolution res) const {
        std::shared_lock<std::shared_mutex> lock(state.mutex);
        return state.market.count(asset, res);
    }

    std::size_t candleCount(const std::string& asset, CandleInterval interval) const {
        std::shared_lock<std::shared_mutex> lock(state.mutex);
        return state.market.candleCount(asset, interval);
    }
};
}

int main() {
    std::cout << "[TEST] Starting PriceIngestion Test..." << std::endl;

    // Full backfill from the feed
    {
        Fixture f;
        auto report = f.service.backfill("BTC", kNow);

        // 61 minute closes interpolated at 5s
        assert(report.raw_ticks == 60 * 12 + 1);
        assert(!report.synthetic);
        assert(!report.derived_ohlc);
        // 289 inclusive closes accepted; the tier keeps the newest 288
        assert(report.five_minute_points == 289);
        assert(f.count("BTC", PriceResolution::FIVE_MINUTE) == 288);
        assert(report.one_minute_candles == 60);
        assert(report.five_minute_candles == 288);

        assert(f.count("BTC", PriceResolution::RAW) == 721);
        assert(f.candleCount("BTC", CandleInterval::ONE_MINUTE) == 60);

        std::shared_lock<std::shared_mutex> lock(f.state.mutex);
        auto latest = f.state.market.latestPrice("BTC");
        assert(latest.has_value());
        assert(std::fabs(*latest - 160.0) < 1e-9);
    }

    // History down: synthetic series around the spot price
    {
        Fixture f;
        f.feed->fail_history = true;
        f.feed->next_price = 200.0;
        auto report = f.service.backfill("BTC", kNow);

        assert(report.synthetic);
        assert(report.raw_ticks == 720);
        // 5m points fall back to the 5m candle closes
        assert(report.five_minute_points == 288);
        assert(!report.derived_ohlc);

        std::shared_lock<std::shared_mutex> lock(f.state.mutex);
        auto window = f.state.market.window("BTC", 720);
        assert(window.size() == 720);
        assert(window.back().timestamp_ms == kNow);
        for (const auto& tick : window) {
            assert(std::fabs(tick.price - 200.0) < 200.0 * 0.02);
        }
    }

    // Whole feed down: seed price and candles derived from the raw backfill
    {
        Fixture f;
        f.feed->fail_history = true;
        f.feed->fail_spot = true;
        f.feed->fail_ohlc = true;
        auto report = f.service.backfill("BTC", kNow);

        assert(report.synthetic);
        assert(report.derived_ohlc);
        assert(report.raw_ticks == 720);
        assert(report.one_minute_candles == 60);
        assert(report.five_minute_candles == 12);
        assert(report.five_minute_points == 12);

        std::shared_lock<std::shared_mutex> lock(f.state.mutex);
        auto latest = f.state.market.latestPrice("BTC");
        assert(latest.has_value());
        assert(std::fabs(*latest - 60000.0) < 60000.0 * 0.02);

        auto five = f.state.market.candles("BTC", 12, CandleInterval::FIVE_MINUTE);
        auto raw = f.state.market.window("BTC", 720);
        assert(five.front().timestamp_ms == raw.front().timestamp_ms);
        assert(five.front().open == raw.front().price);
        assert(five.front().close == raw[59].price);
    }

    // No feed and no seed: nothing is stored
    {
        Fixture f;
        f.feed->fail_history = true;
        f.feed->fail_spot = true;
        f.feed->fail_ohlc = true;
        auto report = f.service.backfill("DOGE", kNow);
        assert(report.raw_ticks == 0);
        assert(report.one_minute_candles == 0);
        assert(report.five_minute_candles == 0);
        assert(f.count("DOGE", PriceResolution::RAW) == 0);
    }

    // Live polling rolls ticks into candles
    {
        Fixture f;
        for (int i = 0; i < 11; ++i) {
            assert(f.service.pollOnce("ETH"));
        }
        assert(f.candleCount("ETH", CandleInterval::ONE_MINUTE) == 0);
        assert(f.service.pollOnce("ETH"));
        assert(f.candleCount("ETH", CandleInterval::ONE_MINUTE) == 1);

        for (int i = 0; i < 48; ++i) {
            assert(f.service.pollOnce("ETH"));
        }
        assert(f.service.pollCount("ETH") == 60);
        assert(f.count("ETH", PriceResolution::RAW) == 60);
        assert(f.candleCount("ETH", CandleInterval::ONE_MINUTE) == 5);
        assert(f.candleCount("ETH", CandleInterval::FIVE_MINUTE) == 1);
        assert(f.count("ETH", PriceResolution::FIVE_MINUTE) == 1);

        std::shared_lock<std::shared_mutex> lock(f.state.mutex);
        auto candle = f.state.market.candles("ETH", 1, CandleInterval::FIVE_MINUTE).front();
        assert(candle.timestamp_ms == kNow);
        assert(candle.open == 100.0);
        assert(candle.high == 159.0);
        assert(candle.low == 100.0);
        assert(candle.close == 159.0);
        auto point = f.state.market.window("ETH", 1, PriceResolution::FIVE_MINUTE).front();
        assert(point.timestamp_ms == kNow);
        assert(point.price == 159.0);
    }

    // Failed polls are counted and leave the store alone
    {
        Fixture f;
        assert(f.service.pollOnce("BTC"));
        f.feed->fail_spot = true;
        assert(!f.service.pollOnce("BTC"));
        assert(!f.service.pollOnce("BTC"));
        assert(f.service.failureCount("BTC") == 2);
        assert(f.service.pollCount("BTC") == 1);
        assert(f.count("BTC", PriceResolution::RAW) == 1);

        assert(!f.service.pollOnce("XRP"));
        assert(f.service.pollCount("XRP") == 0);
    }

    // A zero price is dropped before it can shape a candle
    {
        Fixture f;
        f.feed->zero_prices = 1;
        assert(!f.service.pollOnce("BTC"));
        assert(f.count("BTC", PriceResolution::RAW) == 0);
        for (int i = 0; i < 12; ++i) {
            assert(f.service.pollOnce("BTC"));
        }

        std::shared_lock<std::shared_mutex> lock(f.state.mutex);
        auto candles = f.state.market.candles("BTC", 10, CandleInterval::ONE_MINUTE);
        assert(candles.size() == 1);
        assert(candles.front().open == 100.0);
        assert(candles.front().low == 100.0);
        assert(candles.front().close == 111.0);
    }

    std::cout << "[TEST] PriceIngestion Test PASSED!" << std::endl;
    return 0;
}
