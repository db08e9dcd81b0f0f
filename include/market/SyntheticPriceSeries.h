#pragma once

#include <string>
#include <vector>

#include "common/Types.h"

namespace papertrade {
namespace market {

struct HistoryPoint {
    long long timestamp_ms;
    double close;
};

class SyntheticPriceSeries {
public:
    // Deterministic pseudo-trend ending at end_ms, `count` points spaced
    // step_seconds apart, oldest first:
    //   p(i) = base + sin(i/100)*base*0.01 + sin(i/20)*base*0.005 + sin(7i)*base*0.0002
    // where i counts down from count-1 (oldest) to 0 (end_ms).
    static std::vector<PriceTick> generate(const std::string& asset, double base_price,
                                           long long end_ms, int count, int step_seconds);

    // Linear interpolation between consecutive closes at step_seconds spacing.
    // The last point is always emitted.
    static std::vector<PriceTick> interpolate(const std::string& asset,
                                              const std::vector<HistoryPoint>& points,
                                              int step_seconds);
};

} // namespace market
} // namespace papertrade
