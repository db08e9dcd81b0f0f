#include "strategy/IStrategy.h"

#include <spdlog/fmt/fmt.h>

namespace papertrade {
namespace strategy {

const char* toString(DecisionType type) {
    switch (type) {
        case DecisionType::DO_NOTHING: return "DO_NOTHING";
        case DecisionType::BUY: return "BUY";
        case DecisionType::SELL: return "SELL";
    }
    return "DO_NOTHING";
}

std::string describe(const BotDecision& decision) {
    if (decision.type == DecisionType::DO_NOTHING) {
        return toString(decision.type);
    }
    return fmt::format("{} {:.2f}", toString(decision.type), decision.quote_amount);
}

} // namespace strategy
} // namespace papertrade
