#pragma once

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "common/Types.h"
#include "ledger/Account.h"
#include "market/MarketDataStore.h"

namespace papertrade {
namespace engine {

class BotTask;

// One per running bot. Erasing it from SharedState::active_bots is what
// terminates the owning task.
struct BotSupervisionRecord {
    UserId user_id;
    std::string strategy_name;
    std::string display_name;
    AssetSymbol base_asset;
    AssetSymbol quote_asset;
    double stoploss_amount = 0.0;
    double initial_portfolio_value_usd = 0.0;
    long long started_at_ms = 0;
    std::shared_ptr<BotTask> task;
};

// Process-wide mutable state. Readers take std::shared_lock on mutex, every
// check-and-mutate sequence holds std::unique_lock for its full length.
struct SharedState {
    market::MarketDataStore market;
    std::unordered_map<UserId, ledger::Account> accounts;
    std::map<UserId, BotSupervisionRecord> active_bots;
    mutable std::shared_mutex mutex;

    SharedState() = default;
    explicit SharedState(const market::MarketDataCapacity& capacity) : market(capacity) {}

    SharedState(const SharedState&) = delete;
    SharedState& operator=(const SharedState&) = delete;
};

} // namespace engine
} // namespace papertrade
