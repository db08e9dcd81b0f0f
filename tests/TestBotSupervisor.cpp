#include "engine/BotSupervisor.h"
#include "engine/SharedState.h"
#include "engine/TaskRuntime.h"
#include "ledger/Ledger.h"

#include <atomic>
#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <mutex>
#include <shared_mutex>
#include <thread>

using namespace papertrade;
using engine::BotStartError;
using engine::TickOutcome;

namespace {
// Ticks are driven by hand; the runtime is never started so the queued first
// tick and timers stay idle.
struct Fixture {
    engine::SharedState state;
    engine::TaskRuntime runtime{1};
    ledger::Ledger ledger{state, engine::LedgerConfig()};
    engine::BotSupervisor bots{state, ledger, runtime, engine::BotConfig()};

    ~Fixture() {
        bots.stopAll("test finished");
        // Drain the queued first ticks; each sees its abort flag and returns
        runtime.poll();
    }

    void price(const std::string& asset, double value) {
        std::unique_lock<std::shared_mutex> lock(state.mutex);
        state.market.ingest(PriceTick(nowMs(), asset, value));
    }
};
}

int main() {
    std::cout << "[TEST] Starting BotSupervisor Test..." << std::endl;

    // Start validation
    {
        Fixture f;
        f.ledger.createAccount("alice", "Alice");
        f.price("BTC", 100.0);

        assert(f.bots.start("alice", "naive_momentum", "BTC", "USD", 0.0).error == BotStartError::INVALID_STOPLOSS);
        assert(f.bots.start("alice", "naive_momentum", "BTC", "USD", -1.0).error == BotStartError::INVALID_STOPLOSS);
        assert(f.bots.start("alice", "naive_momentum", "BTC", "BTC", 100.0).error == BotStartError::INVALID_PAIR);
        assert(f.bots.start("alice", "grid", "BTC", "USD", 100.0).error == BotStartError::UNKNOWN_STRATEGY);
        assert(f.bots.start("ghost", "naive_momentum", "BTC", "USD", 100.0).error == BotStartError::USER_NOT_FOUND);
        assert(f.bots.activeBots().empty());

        auto started = f.bots.start("alice", "momentum", "BTC", "USD", 10000.0);
        assert(started.success);
        assert(started.status->strategy_name == "naive_momentum");
        assert(started.status->display_name == "Naive Momentum Bot");
        assert(started.status->initial_portfolio_value_usd == 10000.0);

        assert(f.bots.start("alice", "naive_momentum", "BTC", "USD", 500.0).error == BotStartError::ALREADY_RUNNING);
        assert(f.bots.activeBots().size() == 1);
        assert(f.bots.isRunning("alice"));
    }

    // Rising prices lead to a tagged buy
    {
        Fixture f;
        f.ledger.createAccount("alice", "Alice");
        f.price("BTC", 100.0);
        assert(f.bots.start("alice", "naive_momentum", "BTC", "USD", 10000.0).success);

        assert(f.bots.manualTick("alice") == TickOutcome::CONTINUE);
        f.price("BTC", 101.0);
        assert(f.bots.manualTick("alice") == TickOutcome::CONTINUE);
        f.price("BTC", 102.0);
        assert(f.bots.manualTick("alice") == TickOutcome::CONTINUE);

        auto status = f.bots.status("alice");
        assert(status.has_value());
        assert(status->ticks == 3);
        assert(status->trades == 1);
        assert(status->last_decision == "BUY 100.00");

        auto account = f.ledger.account("alice");
        assert(std::fabs(account->balance("USD") - 9900.0) < 1e-9);
        assert(std::fabs(account->balance("BTC") - 100.0 / 102.0) < 1e-12);
        assert(account->history.size() == 1);
        assert(account->history[0].executed_by == "naive_momentum");
        assert(account->history[0].price == 102.0);
    }

    // Stoploss breach stops and deregisters
    {
        Fixture f;
        f.ledger.createAccount("bob", "Bob");
        f.price("BTC", 1000.0);
        assert(f.ledger.executeTrade("bob", "BTC", "USD", OrderSide::BUY, 5.0).success);
        assert(f.bots.start("bob", "naive_momentum", "BTC", "USD", 50.0).success);

        f.price("BTC", 900.0);
        assert(f.bots.manualTick("bob") == TickOutcome::STOPPED);
        assert(!f.bots.status("bob").has_value());
        assert(!f.bots.isRunning("bob"));
        assert(f.bots.manualTick("bob") == TickOutcome::NOT_RUNNING);
    }

    // Selling without holdings skips the tick but keeps running
    {
        Fixture f;
        f.ledger.createAccount("carol", "Carol");
        f.price("BTC", 110.0);
        assert(f.bots.start("carol", "naive_momentum", "BTC", "USD", 10000.0).success);

        assert(f.bots.manualTick("carol") == TickOutcome::CONTINUE);
        f.price("BTC", 105.0);
        assert(f.bots.manualTick("carol") == TickOutcome::CONTINUE);
        f.price("BTC", 100.0);
        assert(f.bots.manualTick("carol") == TickOutcome::CONTINUE);

        auto status = f.bots.status("carol");
        assert(status->last_decision == "SELL 100.00");
        assert(status->trades == 0);
        assert(f.ledger.account("carol")->history.empty());
    }

    // Buying without funds is a hard stop
    {
        Fixture f;
        f.ledger.createAccount("dave", "Dave");
        assert(f.ledger.withdraw("dave", 9950.0).success);
        f.price("BTC", 100.0);
        assert(f.bots.start("dave", "naive_momentum", "BTC", "USD", 10000.0).success);

        assert(f.bots.manualTick("dave") == TickOutcome::CONTINUE);
        f.price("BTC", 101.0);
        assert(f.bots.manualTick("dave") == TickOutcome::CONTINUE);
        f.price("BTC", 102.0);
        assert(f.bots.manualTick("dave") == TickOutcome::STOPPED);
        assert(!f.bots.isRunning("dave"));
        assert(f.ledger.account("dave")->balance("USD") == 50.0);
    }

    // Missing market data stops the bot
    {
        Fixture f;
        f.ledger.createAccount("erin", "Erin");
        assert(f.bots.start("erin", "naive_momentum", "SOL", "USD", 100.0).success);
        assert(f.bots.manualTick("erin") == TickOutcome::STOPPED);
        assert(!f.bots.isRunning("erin"));
    }

    // Explicit stop, restart with a fresh baseline
    {
        Fixture f;
        f.ledger.createAccount("frank", "Frank");
        f.price("BTC", 100.0);
        assert(f.bots.start("frank", "naive_momentum", "BTC", "USD", 100.0).success);
        assert(f.bots.stop("frank", "user request"));
        assert(!f.bots.stop("frank", "user request"));
        assert(f.bots.manualTick("frank") == TickOutcome::NOT_RUNNING);

        assert(f.ledger.deposit("frank", 1000.0).success);
        auto restarted = f.bots.start("frank", "naive_momentum", "BTC", "USD", 100.0);
        assert(restarted.success);
        assert(restarted.status->initial_portfolio_value_usd == 11000.0);
        assert(restarted.status->ticks == 0);
    }

    // A removed record cancels a trade already in flight
    {
        Fixture f;
        f.ledger.createAccount("gina", "Gina");
        f.price("BTC", 100.0);
        assert(f.bots.start("gina", "naive_momentum", "BTC", "USD", 10000.0).success);

        std::shared_ptr<engine::BotTask> task;
        {
            std::shared_lock<std::shared_mutex> lock(f.state.mutex);
            task = f.state.active_bots.at("gina").task;
        }
        assert(f.bots.stop("gina", "user request"));
        assert(task->aborted());

        ledger::BotTradeRequest request;
        request.user_id = "gina";
        request.base_asset = "BTC";
        request.quote_asset = "USD";
        request.quantity = 1.0;
        request.price = 100.0;
        request.executed_by = "naive_momentum";
        request.guard = [task](const engine::SharedState& s) {
            auto it = s.active_bots.find("gina");
            return it != s.active_bots.end() && it->second.task == task;
        };
        assert(f.ledger.executeBotTrade(request).error == ledger::TradeError::EXECUTION_CANCELLED);
        assert(f.ledger.account("gina")->history.empty());
    }

    // stopAll clears every record
    {
        Fixture f;
        f.ledger.createAccount("u1", "U1");
        f.ledger.createAccount("u2", "U2");
        f.price("BTC", 100.0);
        f.price("ETH", 10.0);
        assert(f.bots.start("u1", "naive_momentum", "BTC", "USD", 100.0).success);
        assert(f.bots.start("u2", "naive_momentum", "ETH", "BTC", 100.0).success);
        assert(f.bots.activeBots().size() == 2);

        f.bots.stopAll("shutdown");
        assert(f.bots.activeBots().empty());
        assert(f.bots.manualTick("u1") == TickOutcome::NOT_RUNNING);
    }

    // Timer-driven loop on a running runtime; stop halts further ticks
    {
        engine::SharedState state;
        engine::TaskRuntime runtime{2};
        ledger::Ledger ledger{state, engine::LedgerConfig()};
        engine::BotConfig config;
        config.tick_interval_seconds = 1;
        engine::BotSupervisor bots{state, ledger, runtime, config};

        ledger.createAccount("hank", "Hank");

        // Steadily rising market so every third tick wants to buy
        std::atomic<bool> feeding{true};
        std::thread feeder([&state, &feeding]() {
            double price = 100.0;
            while (feeding) {
                {
                    std::unique_lock<std::shared_mutex> lock(state.mutex);
                    state.market.ingest(PriceTick(nowMs(), "BTC", price));
                }
                price += 0.5;
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        runtime.start();
        assert(bots.start("hank", "naive_momentum", "BTC", "USD", 10000.0).success);

        auto waitFor = [&bots](unsigned long long ticks, unsigned long long trades) {
            const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(15);
            while (std::chrono::steady_clock::now() < deadline) {
                auto status = bots.status("hank");
                if (status && status->ticks >= ticks && status->trades >= trades) {
                    return true;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
            return false;
        };

        assert(waitFor(1, 0));
        // Later ticks only come from the rescheduled timer
        assert(waitFor(3, 1));
        assert(ledger.account("hank")->balance("BTC") > 0.0);

        assert(bots.stop("hank", "test stop"));
        assert(!bots.isRunning("hank"));

        // Let any tick already in flight settle, then nothing may change
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        const auto history_at_stop = ledger.account("hank")->history.size();
        const auto btc_at_stop = ledger.account("hank")->balance("BTC");
        std::this_thread::sleep_for(std::chrono::milliseconds(3500));
        assert(ledger.account("hank")->history.size() == history_at_stop);
        assert(ledger.account("hank")->balance("BTC") == btc_at_stop);
        assert(!bots.status("hank").has_value());

        feeding = false;
        feeder.join();
        runtime.stop();
    }

    std::cout << "[TEST] BotSupervisor Test PASSED!" << std::endl;
    return 0;
}
