#include "common/Config.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace papertrade {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string normalizeAsset(std::string asset) {
    std::transform(asset.begin(), asset.end(), asset.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return trimCopy(asset);
}

std::string readEnvVar(const char* name) {
    const char* value = std::getenv(name);
    return value ? trimCopy(value) : "";
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::load(const std::string& path) {
    std::filesystem::path config_path;
    if (std::filesystem::path(path).is_absolute()) {
        config_path = path;
    } else if (std::filesystem::exists(path)) {
        config_path = std::filesystem::absolute(path);
    } else {
        config_path = utils::PathUtils::resolveRelativePath(path);
    }

    std::cout << "Config file: " << config_path << std::endl;

    if (!std::filesystem::exists(config_path)) {
        std::cout << "Warning: config file not found, using defaults" << std::endl;
        std::lock_guard<std::mutex> lock(mutex_);
        applyEnvironmentOverrides();
        return;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        std::cout << "Warning: cannot open config file, using defaults" << std::endl;
        std::lock_guard<std::mutex> lock(mutex_);
        applyEnvironmentOverrides();
        return;
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(std::string("Invalid config JSON: ") + e.what());
    }
    loadFromJson(j);
}

void Config::loadFromJson(const nlohmann::json& j) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& cfg = engine_config_;

    if (j.contains("market")) {
        auto& m = j["market"];
        if (m.contains("assets")) {
            cfg.market.assets = m["assets"].get<std::vector<std::string>>();
            for (auto& asset : cfg.market.assets) {
                asset = normalizeAsset(asset);
            }
        }
        cfg.market.poll_interval_seconds = m.value("poll_interval_seconds", 5);
        cfg.market.raw_tick_capacity = m.value("raw_tick_capacity", static_cast<std::size_t>(17280));
        cfg.market.five_minute_capacity = m.value("five_minute_capacity", static_cast<std::size_t>(288));
        cfg.market.one_minute_ohlc_capacity = m.value("one_minute_ohlc_capacity", static_cast<std::size_t>(60));
        cfg.market.five_minute_ohlc_capacity = m.value("five_minute_ohlc_capacity", static_cast<std::size_t>(288));
        cfg.market.ticks_per_one_minute_candle = m.value("ticks_per_one_minute_candle", 12);
        cfg.market.ticks_per_five_minute_candle = m.value("ticks_per_five_minute_candle", 60);
        if (m.contains("seed_prices")) {
            cfg.market.seed_prices.clear();
            for (auto& [asset, price] : m["seed_prices"].items()) {
                cfg.market.seed_prices[normalizeAsset(asset)] = price.get<double>();
            }
        }
    }

    if (j.contains("feed")) {
        auto& f = j["feed"];
        cfg.feed.spot_base_url = f.value("spot_base_url", std::string("https://api.coinbase.com/v2"));
        cfg.feed.exchange_base_url = f.value("exchange_base_url", std::string("https://api.exchange.coinbase.com"));
        cfg.feed.timeout_seconds = f.value("timeout_seconds", 10L);
        cfg.feed.backfill_enabled = f.value("backfill_enabled", true);
    }

    if (j.contains("ledger")) {
        auto& l = j["ledger"];
        cfg.ledger.signup_balance = l.value("signup_balance", 10000.0);
        cfg.ledger.min_deposit = l.value("min_deposit", 10.0);
        cfg.ledger.max_deposit = l.value("max_deposit", 100000.0);
    }

    if (j.contains("bot")) {
        auto& b = j["bot"];
        cfg.bot.tick_interval_seconds = b.value("tick_interval_seconds", 60);
        cfg.bot.lookback_ticks = b.value("lookback_ticks", static_cast<std::size_t>(720));
    }

    if (j.contains("storage")) {
        auto& s = j["storage"];
        cfg.storage.data_dir = s.value("data_dir", std::string("data/accounts"));
        cfg.storage.enabled = s.value("enabled", true);
    }

    if (j.contains("runtime")) {
        cfg.runtime.worker_threads = std::max(1, j["runtime"].value("worker_threads", 4));
    }

    if (j.contains("logging")) {
        auto& l = j["logging"];
        cfg.logging.log_dir = l.value("log_dir", std::string("logs"));
        cfg.logging.log_level = l.value("log_level", std::string("info"));
    }

    applyEnvironmentOverrides();
    loaded_ = true;
}

void Config::applyEnvironmentOverrides() {
    const std::string data_dir = readEnvVar("PAPERTRADE_DATA_DIR");
    if (!data_dir.empty()) {
        engine_config_.storage.data_dir = data_dir;
    }
    const std::string log_level = readEnvVar("PAPERTRADE_LOG_LEVEL");
    if (!log_level.empty()) {
        engine_config_.logging.log_level = log_level;
    }
}

engine::EngineConfig Config::getEngineConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return engine_config_;
}

std::string Config::getLogLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return engine_config_.logging.log_level;
}

std::string Config::getDataDir() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return engine_config_.storage.data_dir;
}

bool Config::isLoaded() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return loaded_;
}

} // namespace papertrade
