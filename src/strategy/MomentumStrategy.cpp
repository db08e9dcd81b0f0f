#include "strategy/MomentumStrategy.h"

#include <spdlog/fmt/fmt.h>

namespace papertrade {
namespace strategy {

MomentumStrategy::MomentumStrategy(double stoploss_amount)
    : step_size_(stoploss_amount * STEP_FRACTION)
    , history_(HISTORY_SIZE)
    , cooldown_remaining_(0)
    , total_buys_(0)
    , total_sells_(0)
    , last_action_("initialized")
{
}

BotDecision MomentumStrategy::tick(const BotContext& context) {
    history_.push(context.current_price);

    if (cooldown_remaining_ > 0) {
        --cooldown_remaining_;
        last_action_ = fmt::format("cooldown ({})", cooldown_remaining_);
        return BotDecision::doNothing();
    }

    if (!history_.hasAtLeast(3)) {
        last_action_ = "warming up";
        return BotDecision::doNothing();
    }

    if (isUptrend()) {
        cooldown_remaining_ = COOLDOWN_TICKS;
        ++total_buys_;
        last_action_ = fmt::format("buy {:.2f}", step_size_);
        return BotDecision::buy(step_size_);
    }

    if (isDowntrend()) {
        cooldown_remaining_ = COOLDOWN_TICKS;
        ++total_sells_;
        last_action_ = fmt::format("sell {:.2f}", step_size_);
        return BotDecision::sell(step_size_);
    }

    last_action_ = "no trend";
    return BotDecision::doNothing();
}

bool MomentumStrategy::isUptrend() const {
    const auto recent = history_.lastN(3);
    return recent.size() == 3 && recent[1] > recent[0] && recent[2] > recent[1];
}

bool MomentumStrategy::isDowntrend() const {
    const auto recent = history_.lastN(3);
    return recent.size() == 3 && recent[1] < recent[0] && recent[2] < recent[1];
}

} // namespace strategy
} // namespace papertrade
