#pragma once

#include "common/Types.h"
#include "core/contracts/IAccountStore.h"
#include "engine/BotSupervisor.h"
#include "engine/EngineConfig.h"
#include "engine/PriceIngestionService.h"
#include "engine/SharedState.h"
#include "engine/TaskRuntime.h"
#include "ledger/AccountMirror.h"
#include "ledger/Ledger.h"
#include "network/IPriceFeed.h"
#include <atomic>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace papertrade {
namespace engine {

struct IndicatorSeries {
    bool success = false;
    std::string error;
    std::string asset;
    std::vector<long long> timestamps_ms;
    std::vector<double> prices;
    std::map<std::string, std::vector<double>> values;     // NaN during warmup
};

struct SimulatorStatus {
    bool running = false;
    std::size_t accounts = 0;
    std::size_t active_bots = 0;
    std::map<std::string, std::size_t> raw_ticks;
    std::map<std::string, std::optional<double>> latest_prices;
};

// Paper trading simulator - owns the shared state and every task that touches it
class TradingSimulator {
public:
    static constexpr std::size_t MIN_INDICATOR_POINTS = 20;

    // store may be null to run without persistence
    TradingSimulator(
        const EngineConfig& config,
        std::shared_ptr<network::IPriceFeed> feed,
        std::shared_ptr<core::IAccountStore> store
    );

    ~TradingSimulator();

    // ===== Lifecycle =====

    // Loads persisted accounts, recreates the demo account. Done by start() too.
    void restoreAccounts();

    bool start();
    void stop();
    bool isRunning() const { return running_; }

    // ===== Accounts and trading =====

    bool signup(const UserId& user_id, const std::string& username);
    ledger::TradeResult trade(const UserId& user_id, const AssetSymbol& base, const AssetSymbol& quote,
                              OrderSide side, double quantity);
    ledger::TradeResult deposit(const UserId& user_id, double amount);
    ledger::TradeResult withdraw(const UserId& user_id, double amount);
    std::optional<ledger::Account> account(const UserId& user_id) const;
    std::optional<ledger::PortfolioValuation> portfolio(const UserId& user_id) const;

    // ===== Market queries =====

    std::optional<double> latestPrice(const AssetSymbol& asset) const;
    std::optional<double> pairPrice(const AssetSymbol& base, const AssetSymbol& quote) const;
    std::vector<PriceTick> priceHistory(const AssetSymbol& asset, std::size_t limit,
                                        market::PriceResolution resolution = market::PriceResolution::RAW) const;
    std::vector<OhlcCandle> candles(const AssetSymbol& asset, std::size_t limit,
                                    market::CandleInterval interval) const;

    // Comma separated names such as "sma_20,ema_12" over the last hour of raw ticks.
    // Malformed names are skipped.
    IndicatorSeries indicators(const AssetSymbol& asset, const std::string& names) const;

    SimulatorStatus status() const;

    // ===== Components =====

    SharedState& state() { return state_; }
    ledger::Ledger& ledger() { return ledger_; }
    BotSupervisor& bots() { return supervisor_; }
    PriceIngestionService& ingestion() { return ingestion_; }
    TaskRuntime& runtime() { return runtime_; }
    const EngineConfig& config() const { return config_; }

private:
    void flushAccounts();

    EngineConfig config_;
    TaskRuntime runtime_;
    SharedState state_;
    std::shared_ptr<network::IPriceFeed> feed_;
    std::shared_ptr<core::IAccountStore> store_;
    ledger::AccountMirror mirror_;
    ledger::Ledger ledger_;
    BotSupervisor supervisor_;
    PriceIngestionService ingestion_;
    std::atomic<bool> running_{false};
};

} // namespace engine
} // namespace papertrade
