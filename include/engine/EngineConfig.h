#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace papertrade {
namespace engine {

// Price ingestion and store capacities
struct MarketConfig {
    std::vector<std::string> assets{"BTC", "ETH"};
    int poll_interval_seconds = 5;
    std::size_t raw_tick_capacity = 17280;      // 24h at 5s
    std::size_t five_minute_capacity = 288;     // 24h
    std::size_t one_minute_ohlc_capacity = 60;  // 1h
    std::size_t five_minute_ohlc_capacity = 288;
    int ticks_per_one_minute_candle = 12;
    int ticks_per_five_minute_candle = 60;
    // Last-resort seed for the synthetic backfill when the feed is down at startup
    std::map<std::string, double> seed_prices{{"BTC", 60000.0}, {"ETH", 3000.0}};
};

struct FeedConfig {
    std::string spot_base_url = "https://api.coinbase.com/v2";
    std::string exchange_base_url = "https://api.exchange.coinbase.com";
    long timeout_seconds = 10;
    bool backfill_enabled = true;
};

struct LedgerConfig {
    double signup_balance = 10000.0;
    double min_deposit = 10.0;
    double max_deposit = 100000.0;
};

struct BotConfig {
    int tick_interval_seconds = 60;
    std::size_t lookback_ticks = 720;           // 1h of raw ticks
};

struct StorageConfig {
    std::string data_dir = "data/accounts";
    bool enabled = true;
};

struct RuntimeConfig {
    int worker_threads = 4;
};

struct LoggingConfig {
    std::string log_dir = "logs";
    std::string log_level = "info";
};

struct EngineConfig {
    MarketConfig market;
    FeedConfig feed;
    LedgerConfig ledger;
    BotConfig bot;
    StorageConfig storage;
    RuntimeConfig runtime;
    LoggingConfig logging;
};

} // namespace engine
} // namespace papertrade
