#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>

namespace papertrade {

using Price = double;
using UserId = std::string;
using AssetSymbol = std::string;

// Every balance and pair price is ultimately expressed against this asset.
inline const AssetSymbol REFERENCE_ASSET = "USD";
inline const UserId DEMO_USER_ID = "demo_user";

enum class OrderSide { BUY, SELL };

struct PriceTick {
    long long timestamp_ms;
    AssetSymbol asset;
    Price price;

    PriceTick() : timestamp_ms(0), price(0) {}

    PriceTick(long long t, AssetSymbol a, Price p)
        : timestamp_ms(t), asset(std::move(a)), price(p) {}
};

// OHLC summary of a fixed number of ticks. timestamp_ms is the period start.
struct OhlcCandle {
    long long timestamp_ms;
    AssetSymbol asset;
    double open;
    double high;
    double low;
    double close;

    OhlcCandle() : timestamp_ms(0), open(0), high(0), low(0), close(0) {}

    OhlcCandle(long long t, AssetSymbol a, double o, double h, double l, double c)
        : timestamp_ms(t), asset(std::move(a)), open(o), high(h), low(l), close(c) {}
};

inline long long nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

inline const char* toString(OrderSide side) {
    return side == OrderSide::BUY ? "BUY" : "SELL";
}

} // namespace papertrade
