#include "engine/BotSupervisor.h"

#include <chrono>
#include <cmath>
#include <map>
#include <shared_mutex>

#include <boost/asio/post.hpp>
#include <spdlog/fmt/fmt.h>

#include "common/Logger.h"
#include "strategy/StrategyRegistry.h"

namespace papertrade {
namespace engine {

const char* toString(BotStartError error) {
    switch (error) {
        case BotStartError::NONE: return "none";
        case BotStartError::INVALID_STOPLOSS: return "stoploss must be positive";
        case BotStartError::INVALID_PAIR: return "base and quote must differ";
        case BotStartError::UNKNOWN_STRATEGY: return "unknown strategy";
        case BotStartError::ALREADY_RUNNING: return "bot already running";
        case BotStartError::USER_NOT_FOUND: return "user not found";
    }
    return "unknown";
}

// ===== BotTask =====

BotTask::BotTask(UserId user_id, std::unique_ptr<strategy::IStrategy> strategy, TaskRuntime::Strand strand)
    : user_id_(std::move(user_id))
    , strategy_(std::move(strategy))
    , strand_(strand)
    , timer_(strand)
    , last_decision_("none")
    , last_action_("initialized")
{
}

std::string BotTask::lastDecision() const {
    std::lock_guard<std::mutex> lock(status_mutex_);
    return last_decision_;
}

std::string BotTask::lastAction() const {
    std::lock_guard<std::mutex> lock(status_mutex_);
    return last_action_;
}

// ===== BotSupervisor =====

BotSupervisor::BotSupervisor(SharedState& state, ledger::Ledger& ledger, TaskRuntime& runtime,
                             const BotConfig& config)
    : state_(state)
    , ledger_(ledger)
    , runtime_(runtime)
    , config_(config)
{
}

BotSupervisor::~BotSupervisor() {
    stopAll("supervisor shutdown");
}

BotStartResult BotSupervisor::start(const UserId& user_id, const std::string& strategy_name,
                                    const AssetSymbol& base, const AssetSymbol& quote, double stoploss_amount) {
    BotStartResult result;
    if (!std::isfinite(stoploss_amount) || stoploss_amount <= 0.0) {
        result.error = BotStartError::INVALID_STOPLOSS;
        return result;
    }
    if (base.empty() || quote.empty() || base == quote) {
        result.error = BotStartError::INVALID_PAIR;
        return result;
    }

    auto strategy = strategy::StrategyRegistry::create(strategy_name, stoploss_amount);
    if (!strategy) {
        result.error = BotStartError::UNKNOWN_STRATEGY;
        return result;
    }
    const std::string display_name = strategy->name();

    auto task = std::make_shared<BotTask>(user_id, std::move(strategy), runtime_.makeStrand());

    BotSupervisionRecord record;
    {
        std::unique_lock<std::shared_mutex> lock(state_.mutex);
        if (state_.active_bots.count(user_id) > 0) {
            result.error = BotStartError::ALREADY_RUNNING;
            return result;
        }
        auto account = state_.accounts.find(user_id);
        if (account == state_.accounts.end()) {
            result.error = BotStartError::USER_NOT_FOUND;
            return result;
        }

        record.user_id = user_id;
        record.strategy_name = strategy::StrategyRegistry::canonicalName(strategy_name);
        record.display_name = display_name;
        record.base_asset = base;
        record.quote_asset = quote;
        record.stoploss_amount = stoploss_amount;
        record.initial_portfolio_value_usd =
            ledger::Ledger::valueAccountLocked(state_, user_id, account->second).total_usd;
        record.started_at_ms = nowMs();
        record.task = task;
        state_.active_bots.emplace(user_id, record);
    }

    LOG_INFO("Bot '{}' started for {} on {}/{} (stoploss {:.2f}, baseline {:.2f} USD)",
             display_name, user_id, base, quote, stoploss_amount, record.initial_portfolio_value_usd);

    boost::asio::post(task->strand_, [this, task]() {
        if (task->aborted()) {
            return;
        }
        runScheduled(task);
    });

    result.success = true;
    result.status = statusFromRecord(record);
    return result;
}

bool BotSupervisor::stop(const UserId& user_id, const std::string& reason) {
    std::shared_ptr<BotTask> task;
    std::string display_name;
    {
        std::unique_lock<std::shared_mutex> lock(state_.mutex);
        auto it = state_.active_bots.find(user_id);
        if (it == state_.active_bots.end()) {
            return false;
        }
        task = it->second.task;
        display_name = it->second.display_name;
        state_.active_bots.erase(it);
    }

    abortTask(task);
    LOG_INFO("Bot '{}' stopped for {}: {}", display_name, user_id, reason);
    return true;
}

void BotSupervisor::stopAll(const std::string& reason) {
    std::map<UserId, BotSupervisionRecord> records;
    {
        std::unique_lock<std::shared_mutex> lock(state_.mutex);
        records.swap(state_.active_bots);
    }

    for (auto& [user_id, record] : records) {
        abortTask(record.task);
        LOG_INFO("Bot '{}' stopped for {}: {}", record.display_name, user_id, reason);
    }
}

void BotSupervisor::stopTask(const std::shared_ptr<BotTask>& task, const std::string& reason) {
    std::string display_name;
    {
        std::unique_lock<std::shared_mutex> lock(state_.mutex);
        if (!ownsRecordLocked(task)) {
            return;
        }
        auto it = state_.active_bots.find(task->userId());
        display_name = it->second.display_name;
        state_.active_bots.erase(it);
    }

    abortTask(task);
    LOG_WARN("Bot '{}' stopped for {}: {}", display_name, task->userId(), reason);
}

void BotSupervisor::abortTask(const std::shared_ptr<BotTask>& task) {
    if (!task) {
        return;
    }
    task->aborted_ = true;

    if (runtime_.isRunning()) {
        boost::asio::post(task->strand_, [task]() { task->timer_.cancel(); });
    } else {
        task->timer_.cancel();
    }
}

bool BotSupervisor::ownsRecordLocked(const std::shared_ptr<BotTask>& task) const {
    auto it = state_.active_bots.find(task->userId());
    return it != state_.active_bots.end() && it->second.task == task;
}

// ===== Ticking =====

void BotSupervisor::runScheduled(const std::shared_ptr<BotTask>& task) {
    if (runTick(task) != TickOutcome::CONTINUE || task->aborted()) {
        LOG_INFO("Bot task for {} terminated", task->userId());
        return;
    }

    task->timer_.expires_after(std::chrono::seconds(config_.tick_interval_seconds));
    task->timer_.async_wait([this, task](const boost::system::error_code& ec) {
        if (ec || task->aborted()) {
            return;
        }
        runScheduled(task);
    });
}

TickOutcome BotSupervisor::manualTick(const UserId& user_id) {
    std::shared_ptr<BotTask> task;
    {
        std::shared_lock<std::shared_mutex> lock(state_.mutex);
        auto it = state_.active_bots.find(user_id);
        if (it == state_.active_bots.end()) {
            return TickOutcome::NOT_RUNNING;
        }
        task = it->second.task;
    }
    return runTick(task);
}

TickOutcome BotSupervisor::runTick(const std::shared_ptr<BotTask>& task) {
    std::lock_guard<std::mutex> tick_lock(task->tick_mutex_);
    if (task->aborted()) {
        return TickOutcome::NOT_RUNNING;
    }

    const UserId& user_id = task->userId();
    strategy::BotContext context;
    double stoploss = 0.0;
    double initial_value = 0.0;
    std::string strategy_tag;
    std::string failure;
    {
        std::shared_lock<std::shared_mutex> lock(state_.mutex);
        if (!ownsRecordLocked(task)) {
            return TickOutcome::NOT_RUNNING;
        }
        const auto& record = state_.active_bots.at(user_id);
        stoploss = record.stoploss_amount;
        initial_value = record.initial_portfolio_value_usd;
        strategy_tag = record.strategy_name;

        context.base_asset = record.base_asset;
        context.quote_asset = record.quote_asset;
        context.tick_count = task->ticks_;
        context.price_window = state_.market.window(record.base_asset, config_.lookback_ticks);

        auto price = state_.market.pairPrice(record.base_asset, record.quote_asset);
        auto account = state_.accounts.find(user_id);
        if (context.price_window.empty()) {
            failure = "no price data for " + record.base_asset;
        } else if (!price) {
            failure = "no price for " + record.base_asset + "/" + record.quote_asset;
        } else if (account == state_.accounts.end()) {
            failure = "user not found";
        } else {
            context.current_price = *price;
            context.base_balance = account->second.balance(record.base_asset);
            context.quote_balance = account->second.balance(record.quote_asset);
        }
    }

    if (!failure.empty()) {
        stopTask(task, "context assembly failed: " + failure);
        return TickOutcome::STOPPED;
    }

    const strategy::BotDecision decision = task->strategy_->tick(context);
    {
        std::lock_guard<std::mutex> lock(task->status_mutex_);
        task->last_decision_ = strategy::describe(decision);
        task->last_action_ = task->strategy_->lastAction();
    }
    LOG_INFO("Bot '{}' tick {} @ {:.2f}: {}", task->strategy_->name(), context.tick_count,
             context.current_price, strategy::describe(decision));

    if (decision.type != strategy::DecisionType::DO_NOTHING) {
        ledger::BotTradeRequest request;
        request.user_id = user_id;
        request.base_asset = context.base_asset;
        request.quote_asset = context.quote_asset;
        request.side = decision.type == strategy::DecisionType::BUY ? OrderSide::BUY : OrderSide::SELL;
        request.quantity = decision.quote_amount / context.current_price;
        request.price = context.current_price;
        request.executed_by = strategy_tag;
        request.guard = [this, task](const SharedState&) {
            return !task->aborted() && ownsRecordLocked(task);
        };

        auto trade = ledger_.executeBotTrade(request);
        if (trade.success) {
            ++task->trades_;
            LOG_INFO("Bot '{}' executed {} {:.8f} {} @ {:.2f}", task->strategy_->name(),
                     toString(request.side), request.quantity, request.base_asset, request.price);
        } else if (trade.error == ledger::TradeError::EXECUTION_CANCELLED) {
            return TickOutcome::NOT_RUNNING;
        } else if (trade.error == ledger::TradeError::INSUFFICIENT_ASSETS) {
            LOG_DEBUG("Bot for {} tried to sell {:.8f} {} but holds {:.8f}, skipping",
                      user_id, request.quantity, request.base_asset, context.base_balance);
        } else if (trade.error == ledger::TradeError::INSUFFICIENT_FUNDS) {
            stopTask(task, fmt::format("insufficient funds: need {:.2f} {} but have {:.2f}",
                                       decision.quote_amount, context.quote_asset, context.quote_balance));
            return TickOutcome::STOPPED;
        } else {
            stopTask(task, std::string("execution error: ") + ledger::toString(trade.error));
            return TickOutcome::STOPPED;
        }
    }

    auto current_value = ledger_.portfolioValueUsd(user_id);
    if (!current_value) {
        stopTask(task, "user not found");
        return TickOutcome::STOPPED;
    }
    const double loss = initial_value - *current_value;
    if (loss >= stoploss) {
        stopTask(task, fmt::format("stoploss breached: lost {:.2f} (limit {:.2f})", loss, stoploss));
        return TickOutcome::STOPPED;
    }

    ++task->ticks_;
    return TickOutcome::CONTINUE;
}

// ===== Queries =====

BotStatus BotSupervisor::statusFromRecord(const BotSupervisionRecord& record) {
    BotStatus status;
    status.user_id = record.user_id;
    status.strategy_name = record.strategy_name;
    status.display_name = record.display_name;
    status.base_asset = record.base_asset;
    status.quote_asset = record.quote_asset;
    status.stoploss_amount = record.stoploss_amount;
    status.initial_portfolio_value_usd = record.initial_portfolio_value_usd;
    status.started_at_ms = record.started_at_ms;
    if (record.task) {
        status.ticks = record.task->ticks();
        status.trades = record.task->trades();
        status.last_decision = record.task->lastDecision();
        status.last_action = record.task->lastAction();
    }
    return status;
}

std::optional<BotStatus> BotSupervisor::status(const UserId& user_id) const {
    std::shared_lock<std::shared_mutex> lock(state_.mutex);
    auto it = state_.active_bots.find(user_id);
    if (it == state_.active_bots.end()) {
        return std::nullopt;
    }
    return statusFromRecord(it->second);
}

std::vector<BotStatus> BotSupervisor::activeBots() const {
    std::vector<BotStatus> result;
    std::shared_lock<std::shared_mutex> lock(state_.mutex);
    for (const auto& [user_id, record] : state_.active_bots) {
        result.push_back(statusFromRecord(record));
    }
    return result;
}

bool BotSupervisor::isRunning(const UserId& user_id) const {
    std::shared_lock<std::shared_mutex> lock(state_.mutex);
    return state_.active_bots.count(user_id) > 0;
}

} // namespace engine
} // namespace papertrade
