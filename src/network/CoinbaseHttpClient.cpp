#include "network/CoinbaseHttpClient.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>
#include <ctime>
#include <sstream>
#include <stdexcept>

namespace papertrade {
namespace network {

namespace {
std::string productId(const std::string& asset) {
    return asset + "-" + REFERENCE_ASSET;
}

std::string truncateForLog(const std::string& text) {
    return text.size() > 200 ? text.substr(0, 200) + "..." : text;
}
}

CoinbaseHttpClient::CoinbaseHttpClient(const engine::FeedConfig& config)
    : config_(config)
{
    curl_global_init(CURL_GLOBAL_ALL);
    curl_ = curl_easy_init();

    if (!curl_) {
        throw std::runtime_error("Failed to initialize CURL");
    }
}

CoinbaseHttpClient::~CoinbaseHttpClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
    curl_global_cleanup();
}

HttpResponse CoinbaseHttpClient::get(
    const std::string& url,
    const std::map<std::string, std::string>& query_params
) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string full_url = url;
    if (!query_params.empty()) {
        full_url += "?" + buildQueryString(query_params);
    }
    return performRequest(full_url);
}

// ===== Price feed =====

PriceTick CoinbaseHttpClient::spot(const std::string& asset) {
    const std::string url = config_.spot_base_url + "/prices/" + productId(asset) + "/spot";
    auto response = get(url);
    if (!response.isSuccess()) {
        throw std::runtime_error("Spot request for " + asset + " failed: HTTP " +
                                 std::to_string(response.status_code) + " " + truncateForLog(response.body));
    }

    try {
        return PriceTick(nowMs(), asset, parseSpotAmount(response.json()));
    } catch (const std::exception& e) {
        throw std::runtime_error("Spot response for " + asset + " not parseable: " + e.what());
    }
}

std::vector<market::HistoryPoint> CoinbaseHttpClient::history(
    const std::string& asset, long long start_ms, long long end_ms, int granularity_seconds) {
    auto candles = ohlc(asset, start_ms, end_ms, granularity_seconds);

    std::vector<market::HistoryPoint> points;
    points.reserve(candles.size());
    for (const auto& candle : candles) {
        points.push_back({candle.timestamp_ms, candle.close});
    }
    return points;
}

std::vector<OhlcCandle> CoinbaseHttpClient::ohlc(
    const std::string& asset, long long start_ms, long long end_ms, int granularity_seconds) {
    auto rows = fetchCandles(asset, start_ms, end_ms, granularity_seconds);
    try {
        auto candles = parseCandles(asset, rows);
        if (candles.empty()) {
            throw std::runtime_error("No candles returned for " + asset);
        }
        return candles;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Candle response for " + asset + " not parseable: " + e.what());
    }
}

nlohmann::json CoinbaseHttpClient::fetchCandles(const std::string& asset, long long start_ms, long long end_ms,
                                                int granularity_seconds) {
    const std::string url = config_.exchange_base_url + "/products/" + productId(asset) + "/candles";
    std::map<std::string, std::string> params;
    params["granularity"] = std::to_string(granularity_seconds);
    params["start"] = toIso8601(start_ms);
    params["end"] = toIso8601(end_ms);

    auto response = get(url, params);
    if (!response.isSuccess()) {
        throw std::runtime_error("Candle request for " + asset + " failed: HTTP " +
                                 std::to_string(response.status_code) + " " + truncateForLog(response.body));
    }

    try {
        auto rows = response.json();
        if (!rows.is_array()) {
            throw std::runtime_error("Candle response for " + asset + " is not an array");
        }
        return rows;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Candle response for " + asset + " not parseable: " + e.what());
    }
}

std::vector<OhlcCandle> CoinbaseHttpClient::parseCandles(const std::string& asset, const nlohmann::json& rows) {
    std::vector<OhlcCandle> candles;
    for (const auto& row : rows) {
        if (!row.is_array() || row.size() < 5) {
            continue;
        }
        const long long time_s = row[0].get<long long>();
        const double low = row[1].get<double>();
        const double high = row[2].get<double>();
        const double open = row[3].get<double>();
        const double close = row[4].get<double>();
        candles.emplace_back(time_s * 1000, asset, open, high, low, close);
    }

    // Exchange returns newest first
    std::sort(candles.begin(), candles.end(), [](const OhlcCandle& a, const OhlcCandle& b) {
        return a.timestamp_ms < b.timestamp_ms;
    });
    return candles;
}

double CoinbaseHttpClient::parseSpotAmount(const nlohmann::json& body) {
    const auto& amount = body.at("data").at("amount");
    double price = amount.is_string() ? std::stod(amount.get<std::string>()) : amount.get<double>();
    if (!std::isfinite(price) || price <= 0.0) {
        throw std::runtime_error("Spot price is not positive");
    }
    return price;
}

std::string CoinbaseHttpClient::toIso8601(long long timestamp_ms) {
    std::time_t seconds = static_cast<std::time_t>(timestamp_ms / 1000);
    std::tm utc{};
    gmtime_r(&seconds, &utc);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buffer;
}

// ===== Transport =====

HttpResponse CoinbaseHttpClient::performRequest(const std::string& url) {
    HttpResponse response;
    std::string response_body;
    std::map<std::string, std::string> response_headers;

    curl_easy_reset(curl_);
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl_, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl_, CURLOPT_HEADERDATA, &response_headers);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT, config_.timeout_seconds);
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);

    // The exchange API rejects requests without a user agent
    struct curl_slist* header_list = nullptr;
    header_list = curl_slist_append(header_list, "User-Agent: papertrade/1.0");
    header_list = curl_slist_append(header_list, "Accept: application/json");
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, header_list);

    CURLcode res = curl_easy_perform(curl_);

    if (res != CURLE_OK) {
        curl_slist_free_all(header_list);
        throw std::runtime_error("CURL error: " + std::string(curl_easy_strerror(res)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_code);

    curl_slist_free_all(header_list);

    response.status_code = static_cast<int>(http_code);
    response.body = response_body;
    response.headers = response_headers;

    if (response.isRateLimited()) {
        LOG_WARN("Rate limited by {}", url);
    }
    return response;
}

size_t CoinbaseHttpClient::writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    std::string* response_body = static_cast<std::string*>(userp);
    response_body->append(static_cast<char*>(contents), total_size);
    return total_size;
}

size_t CoinbaseHttpClient::headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t total_size = size * nitems;
    std::string header_line(buffer, total_size);

    size_t colon_pos = header_line.find(':');
    if (colon_pos != std::string::npos) {
        std::string key = header_line.substr(0, colon_pos);
        std::string value = header_line.substr(colon_pos + 1);

        value.erase(0, value.find_first_not_of(" \t\r\n"));
        value.erase(value.find_last_not_of(" \t\r\n") + 1);

        auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
        (*headers)[key] = value;
    }

    return total_size;
}

std::string CoinbaseHttpClient::buildQueryString(const std::map<std::string, std::string>& params) {
    std::ostringstream oss;
    bool first = true;
    for (const auto& [key, value] : params) {
        if (!first) oss << "&";
        char* escaped = curl_easy_escape(curl_, value.c_str(), static_cast<int>(value.size()));
        oss << key << "=" << (escaped ? escaped : value.c_str());
        curl_free(escaped);
        first = false;
    }
    return oss.str();
}

} // namespace network
} // namespace papertrade
