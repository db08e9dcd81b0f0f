#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "common/Types.h"
#include "engine/EngineConfig.h"
#include "engine/SharedState.h"
#include "ledger/Account.h"

namespace papertrade {
namespace ledger {

class AccountMirror;

enum class TradeError {
    NONE,
    INVALID_QUANTITY,
    INSUFFICIENT_FUNDS,
    INSUFFICIENT_ASSETS,
    PRICE_UNAVAILABLE,
    USER_NOT_FOUND,
    DEPOSIT_TOO_SMALL,
    DEPOSIT_TOO_LARGE,
    WITHDRAWAL_EXCEEDS_BALANCE,
    EXECUTION_CANCELLED
};

const char* toString(TradeError error);

struct TradeResult {
    bool success = false;
    TradeError error = TradeError::NONE;
    std::optional<Transaction> transaction;

    static TradeResult ok(Transaction tx) {
        TradeResult r;
        r.success = true;
        r.transaction = std::move(tx);
        return r;
    }

    static TradeResult fail(TradeError e) {
        TradeResult r;
        r.error = e;
        return r;
    }
};

// Evaluated under the write lock before anything is mutated.
using TradeGuard = std::function<bool(const engine::SharedState&)>;

struct BotTradeRequest {
    UserId user_id;
    AssetSymbol base_asset;
    AssetSymbol quote_asset;
    OrderSide side = OrderSide::BUY;
    double quantity = 0.0;
    double price = 0.0;                 // price the decision was computed at
    std::string executed_by;
    TradeGuard guard;
};

struct AssetHolding {
    AssetSymbol asset;
    double amount = 0.0;
    std::optional<double> usd_price;
    double usd_value = 0.0;
};

struct PortfolioValuation {
    UserId user_id;
    std::vector<AssetHolding> holdings;
    double total_usd = 0.0;
    long long timestamp_ms = 0;
};

class Ledger {
public:
    Ledger(engine::SharedState& state, const engine::LedgerConfig& config, AccountMirror* mirror = nullptr);

    TradeResult executeTrade(const UserId& user_id, const AssetSymbol& base, const AssetSymbol& quote,
                             OrderSide side, double quantity);
    TradeResult executeBotTrade(const BotTradeRequest& request);

    TradeResult deposit(const UserId& user_id, double amount);
    TradeResult withdraw(const UserId& user_id, double amount);

    // Seeds a new account with the signup balance. False if the user exists.
    bool createAccount(const UserId& user_id, const std::string& username);
    void resetDemoAccount();
    void loadAccounts(std::map<UserId, Account> accounts);

    std::optional<Account> account(const UserId& user_id) const;
    std::optional<PortfolioValuation> valuation(const UserId& user_id) const;
    std::optional<double> portfolioValueUsd(const UserId& user_id) const;

    // Caller must hold state.mutex (shared or exclusive).
    static PortfolioValuation valueAccountLocked(const engine::SharedState& state,
                                                 const UserId& user_id, const Account& account);

    const engine::LedgerConfig& config() const { return config_; }

private:
    // Runs with the write lock held. Mutates nothing on failure.
    TradeResult settleLocked(const UserId& user_id, const AssetSymbol& base, const AssetSymbol& quote,
                             OrderSide side, double quantity, double price, const std::string& executed_by);

    void mirror(const UserId& user_id, const std::optional<Account>& snapshot);
    void recordTrade(const TradeResult& result);

    engine::SharedState& state_;
    engine::LedgerConfig config_;
    AccountMirror* mirror_;
};

} // namespace ledger
} // namespace papertrade
