#include "core/state/AccountStoreJson.h"

#include <cctype>
#include <fstream>
#include <stdexcept>
#include <system_error>

#include "common/Logger.h"

namespace papertrade {
namespace core {

namespace {
constexpr int kSchemaVersion = 1;

// Letters, digits and '-' stay; every other byte, '_' included, becomes _XX
// so distinct ids never share a file.
std::string fileStem(const UserId& user_id) {
    static const char kHex[] = "0123456789ABCDEF";
    std::string stem;
    stem.reserve(user_id.size());
    for (char c : user_id) {
        const unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '-') {
            stem.push_back(c);
        } else {
            stem.push_back('_');
            stem.push_back(kHex[uc >> 4]);
            stem.push_back(kHex[uc & 0x0F]);
        }
    }
    return stem.empty() ? std::string("_") : stem;
}
}

AccountStoreJson::AccountStoreJson(std::filesystem::path data_dir)
    : data_dir_(std::move(data_dir)) {}

std::filesystem::path AccountStoreJson::pathFor(const UserId& user_id) const {
    return data_dir_ / (fileStem(user_id) + ".json");
}

std::map<UserId, ledger::Account> AccountStoreJson::loadAll() {
    std::map<UserId, ledger::Account> accounts;
    if (!std::filesystem::exists(data_dir_)) {
        return accounts;
    }

    std::error_code ec;
    std::filesystem::directory_iterator it(data_dir_, ec);
    if (ec) {
        throw std::runtime_error("cannot read account directory " + data_dir_.string() + ": " + ec.message());
    }

    for (const auto& entry : it) {
        if (!entry.is_regular_file() || entry.path().extension() != ".json") {
            continue;
        }

        std::ifstream in(entry.path(), std::ios::binary);
        if (!in.is_open()) {
            LOG_WARN("Account file not readable: {}", entry.path().string());
            continue;
        }

        try {
            nlohmann::json raw;
            in >> raw;
            const UserId user_id = raw.value("user_id", std::string());
            if (user_id.empty() || !raw.contains("account")) {
                LOG_WARN("Account file without user_id/account skipped: {}", entry.path().string());
                continue;
            }
            accounts[user_id] = ledger::accountFromJson(raw["account"]);
        } catch (const nlohmann::json::exception& e) {
            LOG_WARN("Corrupt account file {} skipped: {}", entry.path().string(), e.what());
        }
    }

    return accounts;
}

bool AccountStoreJson::save(const UserId& user_id, const ledger::Account& account) {
    nlohmann::json raw;
    raw["schema_version"] = kSchemaVersion;
    raw["saved_at_ms"] = nowMs();
    raw["user_id"] = user_id;
    raw["account"] = ledger::toJson(account);

    std::error_code ec;
    std::filesystem::create_directories(data_dir_, ec);
    if (ec) {
        return false;
    }

    const auto file_path = pathFor(user_id);
    auto tmp_path = file_path;
    tmp_path += ".tmp";

    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return false;
        }
        out << raw.dump(2);
        if (!out) {
            return false;
        }
    }

    std::filesystem::rename(tmp_path, file_path, ec);
    if (ec) {
        std::filesystem::remove(tmp_path, ec);
        return false;
    }
    return true;
}

bool AccountStoreJson::remove(const UserId& user_id) {
    std::error_code ec;
    const bool removed = std::filesystem::remove(pathFor(user_id), ec);
    return removed && !ec;
}

} // namespace core
} // namespace papertrade
