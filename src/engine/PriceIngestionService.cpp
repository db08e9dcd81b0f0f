#include "engine/PriceIngestionService.h"

#include <chrono>
#include <cmath>
#include <exception>
#include <mutex>
#include <shared_mutex>

#include <boost/asio/post.hpp>

#include "common/Logger.h"
#include "market/SyntheticPriceSeries.h"

namespace papertrade {
namespace engine {

namespace {
constexpr long long kHourMs = 60LL * 60 * 1000;
constexpr long long kDayMs = 24 * kHourMs;
constexpr int kMinuteGranularity = 60;
constexpr int kFiveMinuteGranularity = 300;
constexpr int kSyntheticPoints = 720;

std::vector<OhlcCandle> deriveCandles(const std::string& asset, const std::vector<PriceTick>& ticks,
                                      int ticks_per_candle) {
    market::CandleAccumulator accumulator(asset, ticks_per_candle);
    std::vector<OhlcCandle> candles;
    for (const auto& tick : ticks) {
        if (auto closed = accumulator.add(tick)) {
            candles.push_back(*closed);
        }
    }
    return candles;
}
}

PriceIngestionService::PriceIngestionService(SharedState& state,
                                             std::shared_ptr<network::IPriceFeed> feed,
                                             TaskRuntime& runtime,
                                             const MarketConfig& market_config,
                                             const FeedConfig& feed_config)
    : state_(state)
    , feed_(std::move(feed))
    , runtime_(runtime)
    , market_config_(market_config)
    , feed_config_(feed_config)
{
    for (const auto& asset : market_config_.assets) {
        tasks_[asset] = std::make_unique<AssetTask>(
            asset, runtime_.makeStrand(),
            market_config_.ticks_per_one_minute_candle,
            market_config_.ticks_per_five_minute_candle);
    }
}

void PriceIngestionService::start() {
    stopping_ = false;
    for (auto& [asset, task] : tasks_) {
        AssetTask* t = task.get();
        boost::asio::post(t->strand, [this, t]() {
            if (stopping_) {
                return;
            }
            if (feed_config_.backfill_enabled) {
                try {
                    backfill(t->asset, nowMs());
                } catch (const std::exception& e) {
                    LOG_ERROR("{} backfill aborted: {}", t->asset, e.what());
                }
            }
            LOG_INFO("Live {} polling every {}s", t->asset, market_config_.poll_interval_seconds);
            scheduleNext(*t);
        });
    }
    LOG_INFO("Price ingestion started for {} assets", tasks_.size());
}

void PriceIngestionService::stop() {
    if (stopping_.exchange(true)) {
        return;
    }
    for (auto& [asset, task] : tasks_) {
        AssetTask* t = task.get();
        boost::asio::post(t->strand, [t]() { t->timer.cancel(); });
    }
    LOG_INFO("Price ingestion stopping");
}

void PriceIngestionService::scheduleNext(AssetTask& task) {
    task.timer.expires_after(std::chrono::seconds(market_config_.poll_interval_seconds));
    task.timer.async_wait([this, &task](const boost::system::error_code& ec) {
        if (ec || stopping_) {
            return;
        }
        pollOnce(task.asset);
        scheduleNext(task);
    });
}

PriceIngestionService::AssetTask* PriceIngestionService::find(const std::string& asset) const {
    auto it = tasks_.find(asset);
    return it == tasks_.end() ? nullptr : it->second.get();
}

// ===== Live polling =====

bool PriceIngestionService::pollOnce(const std::string& asset) {
    AssetTask* task = find(asset);
    if (!task) {
        LOG_WARN("pollOnce for unconfigured asset {}", asset);
        return false;
    }

    PriceTick tick;
    try {
        tick = feed_->spot(asset);
    } catch (const std::exception& e) {
        ++task->failures;
        LOG_ERROR("Failed to fetch {} price: {}", asset, e.what());
        return false;
    }

    ++task->polls;
    // Invalid prices never reach the candle tiers
    if (!std::isfinite(tick.price) || tick.price <= 0.0) {
        LOG_WARN("Rejected {} tick with price {}", asset, tick.price);
        return false;
    }

    auto one_minute = task->one_minute.add(tick);
    auto five_minute = task->five_minute.add(tick);

    bool stored = false;
    {
        std::unique_lock<std::shared_mutex> lock(state_.mutex);
        stored = state_.market.ingest(tick);
        if (one_minute) {
            state_.market.ingestOhlc(*one_minute, market::CandleInterval::ONE_MINUTE);
        }
        if (five_minute) {
            state_.market.ingestOhlc(*five_minute, market::CandleInterval::FIVE_MINUTE);
            state_.market.ingest(PriceTick(five_minute->timestamp_ms, asset, five_minute->close),
                                 market::PriceResolution::FIVE_MINUTE);
        }
    }

    if (!stored) {
        LOG_WARN("Rejected {} tick with price {}", asset, tick.price);
        return false;
    }
    LOG_DEBUG("Fetched {} price: {:.2f}", asset, tick.price);
    return true;
}

// ===== Backfill =====

BackfillReport PriceIngestionService::backfill(const std::string& asset, long long now_ms) {
    BackfillReport report;
    report.asset = asset;
    LOG_INFO("Backfilling {} price data", asset);

    // Network first, then one write-lock acquisition for everything.
    auto raw = backfillRaw(asset, now_ms, report.synthetic);

    std::vector<market::HistoryPoint> five_minute_points;
    try {
        five_minute_points = feed_->history(asset, now_ms - kDayMs, now_ms, kFiveMinuteGranularity);
    } catch (const std::exception& e) {
        LOG_WARN("{} 24h history unavailable: {}", asset, e.what());
    }

    auto one_minute_candles = fetchOhlc(asset, now_ms - kHourMs, now_ms, kMinuteGranularity);
    if (one_minute_candles.empty()) {
        one_minute_candles = deriveCandles(asset, raw, market_config_.ticks_per_one_minute_candle);
        report.derived_ohlc = true;
    }

    auto five_minute_candles = fetchOhlc(asset, now_ms - kDayMs, now_ms, kFiveMinuteGranularity);
    if (five_minute_candles.empty()) {
        five_minute_candles = deriveCandles(asset, raw, market_config_.ticks_per_five_minute_candle);
        report.derived_ohlc = true;
    }

    if (five_minute_points.empty()) {
        for (const auto& candle : five_minute_candles) {
            five_minute_points.push_back({candle.timestamp_ms, candle.close});
        }
    }

    {
        std::unique_lock<std::shared_mutex> lock(state_.mutex);
        for (const auto& tick : raw) {
            if (state_.market.ingest(tick)) {
                ++report.raw_ticks;
            }
        }
        for (const auto& point : five_minute_points) {
            if (state_.market.ingest(PriceTick(point.timestamp_ms, asset, point.close),
                                     market::PriceResolution::FIVE_MINUTE)) {
                ++report.five_minute_points;
            }
        }
        for (const auto& candle : one_minute_candles) {
            if (state_.market.ingestOhlc(candle, market::CandleInterval::ONE_MINUTE)) {
                ++report.one_minute_candles;
            }
        }
        for (const auto& candle : five_minute_candles) {
            if (state_.market.ingestOhlc(candle, market::CandleInterval::FIVE_MINUTE)) {
                ++report.five_minute_candles;
            }
        }
    }

    LOG_INFO("{} backfilled: raw={}{} 5m={} ohlc1m={} ohlc5m={}{}",
             asset, report.raw_ticks, report.synthetic ? " (synthetic)" : "",
             report.five_minute_points, report.one_minute_candles, report.five_minute_candles,
             report.derived_ohlc ? " (derived)" : "");
    return report;
}

std::vector<PriceTick> PriceIngestionService::backfillRaw(const std::string& asset, long long now_ms,
                                                         bool& synthetic) {
    const int step = market_config_.poll_interval_seconds;
    try {
        auto points = feed_->history(asset, now_ms - kHourMs, now_ms, kMinuteGranularity);
        auto ticks = market::SyntheticPriceSeries::interpolate(asset, points, step);
        if (!ticks.empty()) {
            LOG_INFO("Interpolated {} minute closes of {} to {} points", points.size(), asset, ticks.size());
            return ticks;
        }
        LOG_WARN("{} 1h history was empty", asset);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to fetch {} historical data: {}", asset, e.what());
    }

    double base_price = 0.0;
    try {
        base_price = feed_->spot(asset).price;
    } catch (const std::exception& e) {
        auto seed = market_config_.seed_prices.find(asset);
        if (seed == market_config_.seed_prices.end()) {
            LOG_ERROR("No spot price and no seed price for {}: {}", asset, e.what());
            return {};
        }
        LOG_WARN("Spot for {} unavailable ({}), seeding from configured {:.2f}", asset, e.what(), seed->second);
        base_price = seed->second;
    }

    synthetic = true;
    LOG_INFO("Falling back to simulated data for {} around {:.2f}", asset, base_price);
    return market::SyntheticPriceSeries::generate(asset, base_price, now_ms, kSyntheticPoints, step);
}

std::vector<OhlcCandle> PriceIngestionService::fetchOhlc(const std::string& asset, long long start_ms,
                                                         long long now_ms, int granularity_seconds) {
    try {
        return feed_->ohlc(asset, start_ms, now_ms, granularity_seconds);
    } catch (const std::exception& e) {
        LOG_WARN("{} OHLC ({}s) unavailable, deriving from raw ticks: {}", asset, granularity_seconds, e.what());
    }
    return {};
}

// ===== Diagnostics =====

std::vector<std::string> PriceIngestionService::assets() const {
    std::vector<std::string> result;
    for (const auto& [asset, task] : tasks_) {
        result.push_back(asset);
    }
    return result;
}

std::size_t PriceIngestionService::pollCount(const std::string& asset) const {
    AssetTask* task = find(asset);
    return task ? task->polls.load() : 0;
}

std::size_t PriceIngestionService::failureCount(const std::string& asset) const {
    AssetTask* task = find(asset);
    return task ? task->failures.load() : 0;
}

} // namespace engine
} // namespace papertrade
