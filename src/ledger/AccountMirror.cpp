#include "ledger/AccountMirror.h"

#include <exception>

#include <boost/asio/post.hpp>

#include "common/Logger.h"

namespace papertrade {
namespace ledger {

AccountMirror::AccountMirror(std::shared_ptr<core::IAccountStore> store, engine::TaskRuntime& runtime)
    : store_(std::move(store))
    , strand_(runtime.makeStrand())
{
}

void AccountMirror::submit(const UserId& user_id, Account snapshot) {
    if (!store_ || user_id == DEMO_USER_ID) {
        return;
    }

    boost::asio::post(strand_, [this, user_id, snapshot = std::move(snapshot)]() {
        write(user_id, snapshot);
    });
}

bool AccountMirror::saveNow(const UserId& user_id, const Account& snapshot) {
    if (!store_ || user_id == DEMO_USER_ID) {
        return false;
    }
    return write(user_id, snapshot);
}

bool AccountMirror::write(const UserId& user_id, const Account& snapshot) {
    const std::size_t version = snapshot.history.size();
    {
        std::lock_guard<std::mutex> lock(versions_mutex_);
        auto it = saved_versions_.find(user_id);
        if (it != saved_versions_.end() && version <= it->second) {
            ++dropped_count_;
            return false;
        }
    }

    bool ok = false;
    try {
        ok = store_->save(user_id, snapshot);
    } catch (const std::exception& e) {
        LOG_ERROR("Account save threw for {}: {}", user_id, e.what());
    }

    if (!ok) {
        ++failed_count_;
        LOG_ERROR("Account save failed for {} (history={})", user_id, version);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(versions_mutex_);
        auto& saved = saved_versions_[user_id];
        if (version > saved) {
            saved = version;
        }
    }
    ++saved_count_;
    return true;
}

} // namespace ledger
} // namespace papertrade
