#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/steady_timer.hpp>

#include "common/Types.h"
#include "engine/EngineConfig.h"
#include "engine/SharedState.h"
#include "engine/TaskRuntime.h"
#include "ledger/Ledger.h"
#include "strategy/IStrategy.h"

namespace papertrade {
namespace engine {

enum class BotStartError {
    NONE,
    INVALID_STOPLOSS,
    INVALID_PAIR,
    UNKNOWN_STRATEGY,
    ALREADY_RUNNING,
    USER_NOT_FOUND
};

const char* toString(BotStartError error);

struct BotStatus {
    UserId user_id;
    std::string strategy_name;
    std::string display_name;
    AssetSymbol base_asset;
    AssetSymbol quote_asset;
    double stoploss_amount = 0.0;
    double initial_portfolio_value_usd = 0.0;
    long long started_at_ms = 0;
    unsigned long long ticks = 0;
    unsigned long long trades = 0;
    std::string last_decision;
    std::string last_action;
};

struct BotStartResult {
    bool success = false;
    BotStartError error = BotStartError::NONE;
    std::optional<BotStatus> status;
};

enum class TickOutcome {
    CONTINUE,       // schedule the next tick
    STOPPED,        // this tick stopped the bot
    NOT_RUNNING     // no live record for this task
};

// Scheduled state of one running bot. Owned by its supervision record and by
// any handler queued on its strand.
class BotTask {
public:
    BotTask(UserId user_id, std::unique_ptr<strategy::IStrategy> strategy, TaskRuntime::Strand strand);

    const UserId& userId() const { return user_id_; }
    bool aborted() const { return aborted_; }

    unsigned long long ticks() const { return ticks_; }
    unsigned long long trades() const { return trades_; }
    std::string lastDecision() const;
    std::string lastAction() const;

private:
    friend class BotSupervisor;

    UserId user_id_;
    std::unique_ptr<strategy::IStrategy> strategy_;
    TaskRuntime::Strand strand_;
    boost::asio::steady_timer timer_;
    std::atomic<bool> aborted_{false};
    std::atomic<unsigned long long> ticks_{0};
    std::atomic<unsigned long long> trades_{0};

    std::mutex tick_mutex_;             // one tick at a time, scheduled or manual
    mutable std::mutex status_mutex_;
    std::string last_decision_;
    std::string last_action_;
};

class BotSupervisor {
public:
    BotSupervisor(SharedState& state, ledger::Ledger& ledger, TaskRuntime& runtime, const BotConfig& config);
    ~BotSupervisor();

    BotSupervisor(const BotSupervisor&) = delete;
    BotSupervisor& operator=(const BotSupervisor&) = delete;

    // The first tick is queued immediately, later ones every tick interval.
    BotStartResult start(const UserId& user_id, const std::string& strategy_name,
                         const AssetSymbol& base, const AssetSymbol& quote, double stoploss_amount);

    // False if the user has no running bot.
    bool stop(const UserId& user_id, const std::string& reason);
    void stopAll(const std::string& reason);

    std::optional<BotStatus> status(const UserId& user_id) const;
    std::vector<BotStatus> activeBots() const;
    bool isRunning(const UserId& user_id) const;

    // Runs one tick on the calling thread, outside the schedule.
    TickOutcome manualTick(const UserId& user_id);

private:
    void runScheduled(const std::shared_ptr<BotTask>& task);
    TickOutcome runTick(const std::shared_ptr<BotTask>& task);

    // Erases the record only if it still belongs to `task`.
    void stopTask(const std::shared_ptr<BotTask>& task, const std::string& reason);

    // Raises the abort flag and cancels the pending timer on the task's strand.
    void abortTask(const std::shared_ptr<BotTask>& task);

    bool ownsRecordLocked(const std::shared_ptr<BotTask>& task) const;
    static BotStatus statusFromRecord(const BotSupervisionRecord& record);

    SharedState& state_;
    ledger::Ledger& ledger_;
    TaskRuntime& runtime_;
    BotConfig config_;
};

} // namespace engine
} // namespace papertrade
