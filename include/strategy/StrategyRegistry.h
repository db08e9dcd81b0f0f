#pragma once

#include "strategy/IStrategy.h"
#include <memory>
#include <string>
#include <vector>

namespace papertrade {
namespace strategy {

// Closed table of strategies a bot can be started with.
class StrategyRegistry {
public:
    // nullptr for an unknown name
    static std::unique_ptr<IStrategy> create(const std::string& name, double stoploss_amount);

    static bool exists(const std::string& name);

    // Resolves aliases to the registry key; empty if unknown
    static std::string canonicalName(const std::string& name);

    static std::vector<StrategyInfo> available();
};

} // namespace strategy
} // namespace papertrade
