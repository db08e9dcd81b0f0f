#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/Types.h"

namespace papertrade {
namespace ledger {

enum class TransactionType {
    TRADE,
    DEPOSIT,
    WITHDRAWAL
};

// Append-only record of one economic action. The USD snapshots exist for
// analytics and never feed back into settlement.
struct Transaction {
    UserId user_id;
    TransactionType type = TransactionType::TRADE;
    AssetSymbol base_asset;
    AssetSymbol quote_asset;
    OrderSide side = OrderSide::BUY;
    double quantity = 0.0;                  // of base
    double price = 0.0;                     // base priced in quote
    long long timestamp_ms = 0;
    std::optional<double> base_usd_price;
    std::optional<double> quote_usd_price;
    std::string executed_by;                // strategy name for bot trades, empty for manual
};

struct Account {
    std::string username;
    std::map<AssetSymbol, double> balances;
    std::vector<Transaction> history;

    Account() = default;
    explicit Account(std::string name) : username(std::move(name)) {}

    double balance(const AssetSymbol& asset) const {
        auto it = balances.find(asset);
        return it == balances.end() ? 0.0 : it->second;
    }
};

const char* toString(TransactionType type);
TransactionType transactionTypeFromString(const std::string& value);

nlohmann::json toJson(const Transaction& tx);
Transaction transactionFromJson(const nlohmann::json& j);
nlohmann::json toJson(const Account& account);
Account accountFromJson(const nlohmann::json& j);

} // namespace ledger
} // namespace papertrade
