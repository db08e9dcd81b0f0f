#include "strategy/StrategyRegistry.h"
#include "strategy/MomentumStrategy.h"

#include <functional>
#include <map>

namespace papertrade {
namespace strategy {

namespace {
struct Entry {
    StrategyInfo info;
    std::function<std::unique_ptr<IStrategy>(double)> factory;
};

const std::vector<Entry>& entries() {
    static const std::vector<Entry> table = {
        {
            {"naive_momentum", "Buys on 3 rising prices, sells on 3 falling prices; 1% of stoploss per trade"},
            [](double stoploss) { return std::make_unique<MomentumStrategy>(stoploss); }
        },
    };
    return table;
}

const std::map<std::string, std::string>& aliases() {
    static const std::map<std::string, std::string> table = {
        {"momentum", "naive_momentum"},
    };
    return table;
}
}

std::string StrategyRegistry::canonicalName(const std::string& name) {
    auto alias = aliases().find(name);
    const std::string key = alias != aliases().end() ? alias->second : name;
    for (const auto& entry : entries()) {
        if (entry.info.name == key) {
            return key;
        }
    }
    return "";
}

bool StrategyRegistry::exists(const std::string& name) {
    return !canonicalName(name).empty();
}

std::unique_ptr<IStrategy> StrategyRegistry::create(const std::string& name, double stoploss_amount) {
    const std::string key = canonicalName(name);
    for (const auto& entry : entries()) {
        if (entry.info.name == key) {
            return entry.factory(stoploss_amount);
        }
    }
    return nullptr;
}

std::vector<StrategyInfo> StrategyRegistry::available() {
    std::vector<StrategyInfo> result;
    for (const auto& entry : entries()) {
        result.push_back(entry.info);
    }
    return result;
}

} // namespace strategy
} // namespace papertrade
