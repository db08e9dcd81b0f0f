#include "engine/TradingSimulator.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Logger.h"
#include <mutex>
#include <shared_mutex>
#include <sstream>
#include <stdexcept>

namespace papertrade {
namespace engine {

namespace {
market::MarketDataCapacity capacityFrom(const MarketConfig& market) {
    market::MarketDataCapacity capacity;
    capacity.raw_ticks = market.raw_tick_capacity;
    capacity.five_minute_points = market.five_minute_capacity;
    capacity.one_minute_candles = market.one_minute_ohlc_capacity;
    capacity.five_minute_candles = market.five_minute_ohlc_capacity;
    return capacity;
}

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}
}

TradingSimulator::TradingSimulator(
    const EngineConfig& config,
    std::shared_ptr<network::IPriceFeed> feed,
    std::shared_ptr<core::IAccountStore> store
)
    : config_(config)
    , runtime_(config.runtime.worker_threads)
    , state_(capacityFrom(config.market))
    , feed_(std::move(feed))
    , store_(config.storage.enabled ? std::move(store) : nullptr)
    , mirror_(store_, runtime_)
    , ledger_(state_, config.ledger, &mirror_)
    , supervisor_(state_, ledger_, runtime_, config.bot)
    , ingestion_(state_, feed_, runtime_, config.market, config.feed)
{
    if (!feed_) {
        throw std::invalid_argument("TradingSimulator requires a price feed");
    }
}

TradingSimulator::~TradingSimulator() {
    stop();
}

// ===== Lifecycle =====

void TradingSimulator::restoreAccounts() {
    if (store_) {
        try {
            ledger_.loadAccounts(store_->loadAll());
        } catch (const std::exception& e) {
            LOG_ERROR("Loading persisted accounts failed: {}", e.what());
        }
        // The demo account lives in memory only
        if (store_->remove(DEMO_USER_ID)) {
            LOG_INFO("Purged stale persisted demo account");
        }
    }
    ledger_.resetDemoAccount();
}

bool TradingSimulator::start() {
    if (running_) {
        return false;
    }

    LOG_INFO("========================================");
    LOG_INFO("Paper trading simulator starting");
    LOG_INFO("========================================");

    restoreAccounts();
    runtime_.start();
    ingestion_.start();

    running_ = true;
    return true;
}

void TradingSimulator::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_INFO("Paper trading simulator stopping");
    ingestion_.stop();
    supervisor_.stopAll("shutdown");
    runtime_.stop();
    flushAccounts();
}

void TradingSimulator::flushAccounts() {
    if (!mirror_.enabled()) {
        return;
    }

    std::vector<std::pair<UserId, ledger::Account>> snapshots;
    {
        std::shared_lock<std::shared_mutex> lock(state_.mutex);
        for (const auto& [user_id, account] : state_.accounts) {
            if (user_id != DEMO_USER_ID) {
                snapshots.emplace_back(user_id, account);
            }
        }
    }

    std::size_t written = 0;
    for (const auto& [user_id, account] : snapshots) {
        if (mirror_.saveNow(user_id, account)) {
            ++written;
        }
    }
    LOG_INFO("Flushed {} of {} accounts at shutdown", written, snapshots.size());
}

// ===== Accounts and trading =====

bool TradingSimulator::signup(const UserId& user_id, const std::string& username) {
    return ledger_.createAccount(user_id, username);
}

ledger::TradeResult TradingSimulator::trade(const UserId& user_id, const AssetSymbol& base,
                                            const AssetSymbol& quote, OrderSide side, double quantity) {
    auto result = ledger_.executeTrade(user_id, base, quote, side, quantity);
    if (!result.success) {
        LOG_WARN("Trade {} {} {}/{} for {} rejected: {}", toString(side), quantity, base, quote,
                 user_id, ledger::toString(result.error));
    }
    return result;
}

ledger::TradeResult TradingSimulator::deposit(const UserId& user_id, double amount) {
    return ledger_.deposit(user_id, amount);
}

ledger::TradeResult TradingSimulator::withdraw(const UserId& user_id, double amount) {
    return ledger_.withdraw(user_id, amount);
}

std::optional<ledger::Account> TradingSimulator::account(const UserId& user_id) const {
    return ledger_.account(user_id);
}

std::optional<ledger::PortfolioValuation> TradingSimulator::portfolio(const UserId& user_id) const {
    return ledger_.valuation(user_id);
}

// ===== Market queries =====

std::optional<double> TradingSimulator::latestPrice(const AssetSymbol& asset) const {
    std::shared_lock<std::shared_mutex> lock(state_.mutex);
    return state_.market.latestPrice(asset);
}

std::optional<double> TradingSimulator::pairPrice(const AssetSymbol& base, const AssetSymbol& quote) const {
    std::shared_lock<std::shared_mutex> lock(state_.mutex);
    return state_.market.pairPrice(base, quote);
}

std::vector<PriceTick> TradingSimulator::priceHistory(const AssetSymbol& asset, std::size_t limit,
                                                      market::PriceResolution resolution) const {
    std::shared_lock<std::shared_mutex> lock(state_.mutex);
    return state_.market.window(asset, limit, resolution);
}

std::vector<OhlcCandle> TradingSimulator::candles(const AssetSymbol& asset, std::size_t limit,
                                                  market::CandleInterval interval) const {
    std::shared_lock<std::shared_mutex> lock(state_.mutex);
    return state_.market.candles(asset, limit, interval);
}

IndicatorSeries TradingSimulator::indicators(const AssetSymbol& asset, const std::string& names) const {
    IndicatorSeries series;
    series.asset = asset;

    const int poll = config_.market.poll_interval_seconds > 0 ? config_.market.poll_interval_seconds : 5;
    const std::size_t one_hour = static_cast<std::size_t>(3600 / poll);

    std::vector<PriceTick> ticks;
    {
        std::shared_lock<std::shared_mutex> lock(state_.mutex);
        ticks = state_.market.window(asset, one_hour);
    }

    if (ticks.empty()) {
        series.error = "no price data for " + asset;
        return series;
    }
    if (ticks.size() < MIN_INDICATOR_POINTS) {
        series.error = "need at least " + std::to_string(MIN_INDICATOR_POINTS) +
                       " points, have " + std::to_string(ticks.size());
        return series;
    }

    series.prices = analytics::TechnicalIndicators::extractPrices(ticks);
    for (const auto& tick : ticks) {
        series.timestamps_ms.push_back(tick.timestamp_ms);
    }

    std::istringstream stream(names);
    std::string name;
    while (std::getline(stream, name, ',')) {
        name = trim(name);
        auto values = analytics::TechnicalIndicators::evaluateNamed(series.prices, name);
        if (values) {
            series.values[name] = std::move(*values);
        }
    }

    series.success = true;
    return series;
}

SimulatorStatus TradingSimulator::status() const {
    SimulatorStatus status;
    status.running = running_;

    std::shared_lock<std::shared_mutex> lock(state_.mutex);
    status.accounts = state_.accounts.size();
    status.active_bots = state_.active_bots.size();
    for (const auto& asset : config_.market.assets) {
        status.raw_ticks[asset] = state_.market.count(asset, market::PriceResolution::RAW);
        status.latest_prices[asset] = state_.market.latestPrice(asset);
    }
    return status;
}

} // namespace engine
} // namespace papertrade
