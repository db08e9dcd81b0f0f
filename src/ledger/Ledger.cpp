#include "ledger/Ledger.h"

#include <cmath>
#include <mutex>
#include <shared_mutex>

#include "common/Logger.h"
#include "ledger/AccountMirror.h"

namespace papertrade {
namespace ledger {

namespace {
std::optional<double> usdSnapshot(const market::MarketDataStore& market, const AssetSymbol& asset) {
    if (asset == REFERENCE_ASSET) {
        return 1.0;
    }
    return market.latestPrice(asset);
}

bool validQuantity(double quantity) {
    return std::isfinite(quantity) && quantity > 0.0;
}
}

const char* toString(TradeError error) {
    switch (error) {
        case TradeError::NONE: return "none";
        case TradeError::INVALID_QUANTITY: return "invalid quantity";
        case TradeError::INSUFFICIENT_FUNDS: return "insufficient funds";
        case TradeError::INSUFFICIENT_ASSETS: return "insufficient assets";
        case TradeError::PRICE_UNAVAILABLE: return "price unavailable";
        case TradeError::USER_NOT_FOUND: return "user not found";
        case TradeError::DEPOSIT_TOO_SMALL: return "deposit below minimum";
        case TradeError::DEPOSIT_TOO_LARGE: return "deposit above maximum";
        case TradeError::WITHDRAWAL_EXCEEDS_BALANCE: return "withdrawal exceeds balance";
        case TradeError::EXECUTION_CANCELLED: return "execution cancelled";
    }
    return "unknown";
}

Ledger::Ledger(engine::SharedState& state, const engine::LedgerConfig& config, AccountMirror* mirror)
    : state_(state)
    , config_(config)
    , mirror_(mirror)
{
}

// ===== Trading =====

TradeResult Ledger::executeTrade(const UserId& user_id, const AssetSymbol& base, const AssetSymbol& quote,
                                 OrderSide side, double quantity) {
    if (!validQuantity(quantity)) {
        return TradeResult::fail(TradeError::INVALID_QUANTITY);
    }

    TradeResult result;
    std::optional<Account> snapshot;
    {
        std::unique_lock<std::shared_mutex> lock(state_.mutex);
        auto price = state_.market.pairPrice(base, quote);
        if (!price) {
            return TradeResult::fail(TradeError::PRICE_UNAVAILABLE);
        }
        result = settleLocked(user_id, base, quote, side, quantity, *price, "");
        if (result.success) {
            snapshot = state_.accounts.at(user_id);
        }
    }

    mirror(user_id, snapshot);
    recordTrade(result);
    return result;
}

TradeResult Ledger::executeBotTrade(const BotTradeRequest& request) {
    if (!validQuantity(request.quantity)) {
        return TradeResult::fail(TradeError::INVALID_QUANTITY);
    }

    TradeResult result;
    std::optional<Account> snapshot;
    {
        std::unique_lock<std::shared_mutex> lock(state_.mutex);
        if (request.guard && !request.guard(state_)) {
            return TradeResult::fail(TradeError::EXECUTION_CANCELLED);
        }
        if (!std::isfinite(request.price) || request.price <= 0.0) {
            return TradeResult::fail(TradeError::PRICE_UNAVAILABLE);
        }
        result = settleLocked(request.user_id, request.base_asset, request.quote_asset,
                              request.side, request.quantity, request.price, request.executed_by);
        if (result.success) {
            snapshot = state_.accounts.at(request.user_id);
        }
    }

    mirror(request.user_id, snapshot);
    recordTrade(result);
    return result;
}

TradeResult Ledger::settleLocked(const UserId& user_id, const AssetSymbol& base, const AssetSymbol& quote,
                                 OrderSide side, double quantity, double price, const std::string& executed_by) {
    auto it = state_.accounts.find(user_id);
    if (it == state_.accounts.end()) {
        return TradeResult::fail(TradeError::USER_NOT_FOUND);
    }
    Account& account = it->second;

    const double cost = price * quantity;
    if (!std::isfinite(cost)) {
        return TradeResult::fail(TradeError::INVALID_QUANTITY);
    }

    if (side == OrderSide::BUY) {
        if (account.balance(quote) < cost) {
            return TradeResult::fail(TradeError::INSUFFICIENT_FUNDS);
        }
        account.balances[quote] = account.balance(quote) - cost;
        account.balances[base] = account.balance(base) + quantity;
    } else {
        if (account.balance(base) < quantity) {
            return TradeResult::fail(TradeError::INSUFFICIENT_ASSETS);
        }
        account.balances[base] = account.balance(base) - quantity;
        account.balances[quote] = account.balance(quote) + cost;
    }

    Transaction tx;
    tx.user_id = user_id;
    tx.type = TransactionType::TRADE;
    tx.base_asset = base;
    tx.quote_asset = quote;
    tx.side = side;
    tx.quantity = quantity;
    tx.price = price;
    tx.timestamp_ms = nowMs();
    tx.base_usd_price = usdSnapshot(state_.market, base);
    tx.quote_usd_price = usdSnapshot(state_.market, quote);
    tx.executed_by = executed_by;
    account.history.push_back(tx);
    return TradeResult::ok(std::move(tx));
}

// ===== Cash movements =====

TradeResult Ledger::deposit(const UserId& user_id, double amount) {
    if (!std::isfinite(amount)) {
        return TradeResult::fail(TradeError::INVALID_QUANTITY);
    }
    if (amount < config_.min_deposit) {
        return TradeResult::fail(TradeError::DEPOSIT_TOO_SMALL);
    }
    if (amount > config_.max_deposit) {
        return TradeResult::fail(TradeError::DEPOSIT_TOO_LARGE);
    }

    Transaction tx;
    Account snapshot;
    {
        std::unique_lock<std::shared_mutex> lock(state_.mutex);
        auto it = state_.accounts.find(user_id);
        if (it == state_.accounts.end()) {
            return TradeResult::fail(TradeError::USER_NOT_FOUND);
        }
        Account& account = it->second;
        account.balances[REFERENCE_ASSET] = account.balance(REFERENCE_ASSET) + amount;

        tx.user_id = user_id;
        tx.type = TransactionType::DEPOSIT;
        tx.base_asset = REFERENCE_ASSET;
        tx.quote_asset = REFERENCE_ASSET;
        tx.side = OrderSide::BUY;
        tx.quantity = amount;
        tx.price = 1.0;
        tx.timestamp_ms = nowMs();
        tx.base_usd_price = 1.0;
        tx.quote_usd_price = 1.0;
        account.history.push_back(tx);
        snapshot = account;
    }

    LOG_INFO("Deposit {} {} for {}", amount, REFERENCE_ASSET, user_id);
    mirror(user_id, snapshot);
    return TradeResult::ok(std::move(tx));
}

TradeResult Ledger::withdraw(const UserId& user_id, double amount) {
    if (!validQuantity(amount)) {
        return TradeResult::fail(TradeError::INVALID_QUANTITY);
    }

    Transaction tx;
    Account snapshot;
    {
        std::unique_lock<std::shared_mutex> lock(state_.mutex);
        auto it = state_.accounts.find(user_id);
        if (it == state_.accounts.end()) {
            return TradeResult::fail(TradeError::USER_NOT_FOUND);
        }
        Account& account = it->second;
        if (amount > account.balance(REFERENCE_ASSET)) {
            return TradeResult::fail(TradeError::WITHDRAWAL_EXCEEDS_BALANCE);
        }
        account.balances[REFERENCE_ASSET] = account.balance(REFERENCE_ASSET) - amount;

        tx.user_id = user_id;
        tx.type = TransactionType::WITHDRAWAL;
        tx.base_asset = REFERENCE_ASSET;
        tx.quote_asset = REFERENCE_ASSET;
        tx.side = OrderSide::SELL;
        tx.quantity = amount;
        tx.price = 1.0;
        tx.timestamp_ms = nowMs();
        tx.base_usd_price = 1.0;
        tx.quote_usd_price = 1.0;
        account.history.push_back(tx);
        snapshot = account;
    }

    LOG_INFO("Withdrawal {} {} for {}", amount, REFERENCE_ASSET, user_id);
    mirror(user_id, snapshot);
    return TradeResult::ok(std::move(tx));
}

// ===== Accounts =====

bool Ledger::createAccount(const UserId& user_id, const std::string& username) {
    Account snapshot(username);
    snapshot.balances[REFERENCE_ASSET] = config_.signup_balance;
    {
        std::unique_lock<std::shared_mutex> lock(state_.mutex);
        if (!state_.accounts.emplace(user_id, snapshot).second) {
            return false;
        }
    }

    LOG_INFO("Account created: {} ({}) with {} {}", user_id, username, config_.signup_balance, REFERENCE_ASSET);
    mirror(user_id, snapshot);
    return true;
}

void Ledger::resetDemoAccount() {
    Account demo("Demo User");
    demo.balances[REFERENCE_ASSET] = config_.signup_balance;

    std::unique_lock<std::shared_mutex> lock(state_.mutex);
    state_.accounts[DEMO_USER_ID] = std::move(demo);
}

void Ledger::loadAccounts(std::map<UserId, Account> accounts) {
    std::size_t loaded = 0;
    {
        std::unique_lock<std::shared_mutex> lock(state_.mutex);
        for (auto& [user_id, account] : accounts) {
            if (user_id == DEMO_USER_ID) {
                continue;
            }
            state_.accounts[user_id] = std::move(account);
            ++loaded;
        }
    }
    LOG_INFO("Loaded {} persisted accounts", loaded);
}

std::optional<Account> Ledger::account(const UserId& user_id) const {
    std::shared_lock<std::shared_mutex> lock(state_.mutex);
    auto it = state_.accounts.find(user_id);
    if (it == state_.accounts.end()) {
        return std::nullopt;
    }
    return it->second;
}

// ===== Valuation =====

PortfolioValuation Ledger::valueAccountLocked(const engine::SharedState& state,
                                              const UserId& user_id, const Account& account) {
    PortfolioValuation valuation;
    valuation.user_id = user_id;
    valuation.timestamp_ms = nowMs();

    for (const auto& [asset, amount] : account.balances) {
        AssetHolding holding;
        holding.asset = asset;
        holding.amount = amount;
        holding.usd_price = usdSnapshot(state.market, asset);
        if (holding.usd_price) {
            holding.usd_value = amount * (*holding.usd_price);
        } else if (amount != 0.0) {
            LOG_WARN("No USD price for {} held by {}; valued at zero", asset, user_id);
        }
        valuation.total_usd += holding.usd_value;
        valuation.holdings.push_back(std::move(holding));
    }
    return valuation;
}

std::optional<PortfolioValuation> Ledger::valuation(const UserId& user_id) const {
    std::shared_lock<std::shared_mutex> lock(state_.mutex);
    auto it = state_.accounts.find(user_id);
    if (it == state_.accounts.end()) {
        return std::nullopt;
    }
    return valueAccountLocked(state_, user_id, it->second);
}

std::optional<double> Ledger::portfolioValueUsd(const UserId& user_id) const {
    auto v = valuation(user_id);
    if (!v) {
        return std::nullopt;
    }
    return v->total_usd;
}

void Ledger::recordTrade(const TradeResult& result) {
    if (!result.success || !result.transaction) {
        return;
    }
    const Transaction& tx = *result.transaction;
    Logger::getInstance().logTrade(tx.user_id, tx.base_asset + "/" + tx.quote_asset, toString(tx.side),
                                   tx.price, tx.quantity, tx.executed_by);
}

void Ledger::mirror(const UserId& user_id, const std::optional<Account>& snapshot) {
    if (mirror_ && snapshot) {
        mirror_->submit(user_id, *snapshot);
    }
}

} // namespace ledger
} // namespace papertrade
