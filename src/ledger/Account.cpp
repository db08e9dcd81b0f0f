#include "ledger/Account.h"

namespace papertrade {
namespace ledger {

namespace {
void putOptional(nlohmann::json& j, const char* key, const std::optional<double>& value) {
    if (value) {
        j[key] = *value;
    } else {
        j[key] = nullptr;
    }
}

std::optional<double> getOptional(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    return j[key].get<double>();
}
}

const char* toString(TransactionType type) {
    switch (type) {
        case TransactionType::TRADE: return "TRADE";
        case TransactionType::DEPOSIT: return "DEPOSIT";
        case TransactionType::WITHDRAWAL: return "WITHDRAWAL";
    }
    return "TRADE";
}

TransactionType transactionTypeFromString(const std::string& value) {
    if (value == "DEPOSIT") return TransactionType::DEPOSIT;
    if (value == "WITHDRAWAL") return TransactionType::WITHDRAWAL;
    return TransactionType::TRADE;
}

nlohmann::json toJson(const Transaction& tx) {
    nlohmann::json j;
    j["user_id"] = tx.user_id;
    j["type"] = toString(tx.type);
    j["base_asset"] = tx.base_asset;
    j["quote_asset"] = tx.quote_asset;
    j["side"] = toString(tx.side);
    j["quantity"] = tx.quantity;
    j["price"] = tx.price;
    j["timestamp_ms"] = tx.timestamp_ms;
    putOptional(j, "base_usd_price", tx.base_usd_price);
    putOptional(j, "quote_usd_price", tx.quote_usd_price);
    j["executed_by"] = tx.executed_by;
    return j;
}

Transaction transactionFromJson(const nlohmann::json& j) {
    Transaction tx;
    tx.user_id = j.value("user_id", std::string());
    tx.type = transactionTypeFromString(j.value("type", std::string("TRADE")));
    tx.base_asset = j.value("base_asset", std::string());
    tx.quote_asset = j.value("quote_asset", std::string());
    tx.side = (j.value("side", std::string("BUY")) == "SELL") ? OrderSide::SELL : OrderSide::BUY;
    tx.quantity = j.value("quantity", 0.0);
    tx.price = j.value("price", 0.0);
    tx.timestamp_ms = j.value("timestamp_ms", 0LL);
    tx.base_usd_price = getOptional(j, "base_usd_price");
    tx.quote_usd_price = getOptional(j, "quote_usd_price");
    tx.executed_by = j.value("executed_by", std::string());
    return tx;
}

nlohmann::json toJson(const Account& account) {
    nlohmann::json j;
    j["username"] = account.username;
    j["balances"] = nlohmann::json::object();
    for (const auto& [asset, amount] : account.balances) {
        j["balances"][asset] = amount;
    }
    j["history"] = nlohmann::json::array();
    for (const auto& tx : account.history) {
        j["history"].push_back(toJson(tx));
    }
    return j;
}

Account accountFromJson(const nlohmann::json& j) {
    Account account(j.value("username", std::string()));
    if (j.contains("balances") && j["balances"].is_object()) {
        for (auto& [asset, amount] : j["balances"].items()) {
            account.balances[asset] = amount.get<double>();
        }
    }
    if (j.contains("history") && j["history"].is_array()) {
        for (const auto& row : j["history"]) {
            account.history.push_back(transactionFromJson(row));
        }
    }
    return account;
}

} // namespace ledger
} // namespace papertrade
