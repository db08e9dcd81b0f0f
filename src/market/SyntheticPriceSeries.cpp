#include "market/SyntheticPriceSeries.h"

#include <cmath>

namespace papertrade {
namespace market {

std::vector<PriceTick> SyntheticPriceSeries::generate(const std::string& asset, double base_price,
                                                      long long end_ms, int count, int step_seconds) {
    std::vector<PriceTick> out;
    if (count <= 0 || base_price <= 0.0) {
        return out;
    }
    out.reserve(count);

    const long long step_ms = static_cast<long long>(step_seconds) * 1000;
    for (int i = count - 1; i >= 0; --i) {
        const double x = static_cast<double>(i);
        const double trend = std::sin(x / 100.0) * base_price * 0.01;
        const double short_term = std::sin(x / 20.0) * base_price * 0.005;
        const double noise = std::sin(x * 7.0) * base_price * 0.0002;

        out.emplace_back(end_ms - i * step_ms, asset, base_price + trend + short_term + noise);
    }
    return out;
}

std::vector<PriceTick> SyntheticPriceSeries::interpolate(const std::string& asset,
                                                         const std::vector<HistoryPoint>& points,
                                                         int step_seconds) {
    std::vector<PriceTick> out;
    if (points.empty() || step_seconds <= 0) {
        return out;
    }

    const long long step_ms = static_cast<long long>(step_seconds) * 1000;
    for (size_t i = 0; i + 1 < points.size(); ++i) {
        const auto& from = points[i];
        const auto& to = points[i + 1];
        const long long span = to.timestamp_ms - from.timestamp_ms;
        if (span <= 0) {
            continue;
        }
        for (long long t = from.timestamp_ms; t < to.timestamp_ms; t += step_ms) {
            const double frac = static_cast<double>(t - from.timestamp_ms) / static_cast<double>(span);
            out.emplace_back(t, asset, from.close + (to.close - from.close) * frac);
        }
    }
    out.emplace_back(points.back().timestamp_ms, asset, points.back().close);
    return out;
}

} // namespace market
} // namespace papertrade
