#pragma once

#include "strategy/IStrategy.h"
#include "strategy/PriceHistory.h"

namespace papertrade {
namespace strategy {

// Buys after three consecutive rising prices, sells after three falling ones.
// Trade size is 1% of the stoploss; every trade is followed by a 3-tick cooldown.
class MomentumStrategy : public IStrategy {
public:
    static constexpr std::size_t HISTORY_SIZE = 10;
    static constexpr int COOLDOWN_TICKS = 3;
    static constexpr double STEP_FRACTION = 0.01;

    explicit MomentumStrategy(double stoploss_amount);

    BotDecision tick(const BotContext& context) override;
    std::string name() const override { return "Naive Momentum Bot"; }
    std::string lastAction() const override { return last_action_; }

    double stepSize() const { return step_size_; }
    int cooldownRemaining() const { return cooldown_remaining_; }
    int totalBuys() const { return total_buys_; }
    int totalSells() const { return total_sells_; }

private:
    bool isUptrend() const;
    bool isDowntrend() const;

    double step_size_;
    PriceHistory history_;
    int cooldown_remaining_;
    int total_buys_;
    int total_sells_;
    std::string last_action_;
};

} // namespace strategy
} // namespace papertrade
