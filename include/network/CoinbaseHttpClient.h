#pragma once

#include "network/IHttpClient.h"
#include "network/IPriceFeed.h"
#include "engine/EngineConfig.h"
#include <curl/curl.h>
#include <mutex>

namespace papertrade {
namespace network {

// Public Coinbase endpoints over one libcurl easy handle.
//   spot:    <spot_base_url>/prices/<ASSET>-USD/spot
//   candles: <exchange_base_url>/products/<ASSET>-USD/candles
class CoinbaseHttpClient : public IHttpClient, public IPriceFeed {
public:
    explicit CoinbaseHttpClient(const engine::FeedConfig& config);
    ~CoinbaseHttpClient();

    CoinbaseHttpClient(const CoinbaseHttpClient&) = delete;
    CoinbaseHttpClient& operator=(const CoinbaseHttpClient&) = delete;

    HttpResponse get(
        const std::string& url,
        const std::map<std::string, std::string>& query_params = {}
    ) override;

    PriceTick spot(const std::string& asset) override;
    std::vector<market::HistoryPoint> history(
        const std::string& asset, long long start_ms, long long end_ms, int granularity_seconds) override;
    std::vector<OhlcCandle> ohlc(
        const std::string& asset, long long start_ms, long long end_ms, int granularity_seconds) override;

    // Rows of [time, low, high, open, close, volume], any order; result is oldest first
    static std::vector<OhlcCandle> parseCandles(const std::string& asset, const nlohmann::json& rows);
    static double parseSpotAmount(const nlohmann::json& body);
    static std::string toIso8601(long long timestamp_ms);

private:
    nlohmann::json fetchCandles(const std::string& asset, long long start_ms, long long end_ms,
                                int granularity_seconds);

    HttpResponse performRequest(const std::string& url);

    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);
    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata);

    std::string buildQueryString(const std::map<std::string, std::string>& params);

    engine::FeedConfig config_;
    CURL* curl_;
    std::mutex mutex_;
};

} // namespace network
} // namespace papertrade
