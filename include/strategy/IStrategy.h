#pragma once

#include "common/Types.h"
#include <string>
#include <vector>

namespace papertrade {
namespace strategy {

enum class DecisionType {
    DO_NOTHING,
    BUY,            // spend quote_amount of quote
    SELL            // sell quote_amount worth of base
};

struct BotDecision {
    DecisionType type;
    double quote_amount;

    BotDecision() : type(DecisionType::DO_NOTHING), quote_amount(0.0) {}
    BotDecision(DecisionType t, double amount) : type(t), quote_amount(amount) {}

    static BotDecision doNothing() { return BotDecision(); }
    static BotDecision buy(double amount) { return BotDecision(DecisionType::BUY, amount); }
    static BotDecision sell(double amount) { return BotDecision(DecisionType::SELL, amount); }

    bool operator==(const BotDecision& other) const {
        return type == other.type && quote_amount == other.quote_amount;
    }
};

// Read-only snapshot handed to a strategy each tick
struct BotContext {
    std::vector<PriceTick> price_window;    // raw ticks of base, oldest first
    double base_balance;
    double quote_balance;
    double current_price;                   // base priced in quote
    AssetSymbol base_asset;
    AssetSymbol quote_asset;
    unsigned long long tick_count;          // 0 on the first tick

    BotContext()
        : base_balance(0.0)
        , quote_balance(0.0)
        , current_price(0.0)
        , tick_count(0)
    {}
};

struct StrategyInfo {
    std::string name;           // registry key
    std::string description;
};

// Decision function of market and portfolio context. Instances keep their
// own state across ticks and are owned by exactly one bot task.
class IStrategy {
public:
    virtual ~IStrategy() = default;

    virtual BotDecision tick(const BotContext& context) = 0;

    // Display name used in logs and the audit tag of executed trades
    virtual std::string name() const = 0;

    // Short human-readable summary of the last tick
    virtual std::string lastAction() const { return ""; }
};

const char* toString(DecisionType type);
std::string describe(const BotDecision& decision);

} // namespace strategy
} // namespace papertrade
