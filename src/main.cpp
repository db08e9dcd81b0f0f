#include "common/Logger.h"
#include "common/Config.h"
#include "common/PathUtils.h"
#include "core/state/AccountStoreJson.h"
#include "engine/TradingSimulator.h"
#include "network/CoinbaseHttpClient.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace papertrade;

namespace {
std::atomic<bool> g_shutdown_requested{false};

void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdown_requested = true;
    }
}

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [--config <path>] [--demo-bot <strategy>] [--stoploss <usd>]\n"
              << "  --config    configuration file (default: config/config.json)\n"
              << "  --demo-bot  start a bot for the demo account on BTC/USD\n"
              << "  --stoploss  stoploss for the demo bot in USD (default: 1000)\n";
}

void logStatus(engine::TradingSimulator& simulator) {
    auto status = simulator.status();
    for (const auto& [asset, price] : status.latest_prices) {
        if (price) {
            LOG_INFO("{}: {:.2f} USD ({} ticks)", asset, *price, status.raw_ticks[asset]);
        } else {
            LOG_INFO("{}: no price yet", asset);
        }
    }
    for (const auto& bot : simulator.bots().activeBots()) {
        LOG_INFO("Bot '{}' for {}: ticks={} trades={} last={}",
                 bot.display_name, bot.user_id, bot.ticks, bot.trades, bot.last_decision);
    }
    if (auto demo = simulator.portfolio(DEMO_USER_ID)) {
        LOG_INFO("Demo portfolio: {:.2f} USD", demo->total_usd);
    }
}
}

int main(int argc, char* argv[]) {
    std::string config_path = "config/config.json";
    std::string demo_strategy;
    double demo_stoploss = 1000.0;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--demo-bot" && i + 1 < argc) {
            demo_strategy = argv[++i];
        } else if (arg == "--stoploss" && i + 1 < argc) {
            try {
                demo_stoploss = std::stod(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid --stoploss value\n";
                return 1;
            }
        } else {
            printUsage(argv[0]);
            return 1;
        }
    }

    try {
        auto& config = Config::getInstance();
        config.load(config_path);
        auto engine_config = config.getEngineConfig();

        Logger::getInstance().initialize(engine_config.logging.log_dir, engine_config.logging.log_level);

        LOG_INFO("========================================");
        LOG_INFO("PaperTrade simulator v1.0");
        LOG_INFO("========================================");

        std::filesystem::path data_dir(engine_config.storage.data_dir);
        if (data_dir.is_relative()) {
            data_dir = utils::PathUtils::resolveRelativePath(engine_config.storage.data_dir);
        }
        LOG_INFO("Account data: {}", data_dir.string());

        auto feed = std::make_shared<network::CoinbaseHttpClient>(engine_config.feed);
        auto store = std::make_shared<core::AccountStoreJson>(data_dir);

        engine::TradingSimulator simulator(engine_config, feed, store);

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        if (!simulator.start()) {
            LOG_ERROR("Simulator start failed");
            return 1;
        }

        if (!demo_strategy.empty()) {
            // Give the ingestion tasks time to backfill before the first tick
            std::this_thread::sleep_for(std::chrono::seconds(5));
            auto started = simulator.bots().start(DEMO_USER_ID, demo_strategy, "BTC", REFERENCE_ASSET, demo_stoploss);
            if (!started.success) {
                LOG_ERROR("Demo bot not started: {}", engine::toString(started.error));
            }
        }

        LOG_INFO("Running. Press Ctrl+C to stop.");

        auto last_status = std::chrono::steady_clock::now();
        while (!g_shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            auto now = std::chrono::steady_clock::now();
            if (now - last_status >= std::chrono::seconds(60)) {
                logStatus(simulator);
                last_status = now;
            }
        }

        LOG_INFO("Shutdown signal received");
        simulator.stop();
        LOG_INFO("Program terminated");
        return 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
