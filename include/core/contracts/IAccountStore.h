#pragma once

#include <map>

#include "common/Types.h"
#include "ledger/Account.h"

namespace papertrade {
namespace core {

class IAccountStore {
public:
    virtual ~IAccountStore() = default;

    virtual std::map<UserId, ledger::Account> loadAll() = 0;
    virtual bool save(const UserId& user_id, const ledger::Account& account) = 0;
    virtual bool remove(const UserId& user_id) = 0;
};

} // namespace core
} // namespace papertrade
