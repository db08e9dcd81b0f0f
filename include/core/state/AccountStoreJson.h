#pragma once

#include <filesystem>
#include <map>

#include "core/contracts/IAccountStore.h"

namespace papertrade {
namespace core {

// One JSON document per user under data_dir, replaced atomically on save.
class AccountStoreJson : public IAccountStore {
public:
    explicit AccountStoreJson(std::filesystem::path data_dir);

    std::map<UserId, ledger::Account> loadAll() override;
    bool save(const UserId& user_id, const ledger::Account& account) override;
    bool remove(const UserId& user_id) override;

    std::filesystem::path pathFor(const UserId& user_id) const;

private:
    std::filesystem::path data_dir_;
};

} // namespace core
} // namespace papertrade
