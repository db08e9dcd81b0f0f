#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>

#include "common/Types.h"
#include "core/contracts/IAccountStore.h"
#include "engine/TaskRuntime.h"
#include "ledger/Account.h"

namespace papertrade {
namespace ledger {

// Best-effort asynchronous copy of account snapshots into the durable store.
// Saves run one at a time on a strand; a snapshot whose history is not longer
// than the last one saved for that user is dropped. The demo account is never
// written.
class AccountMirror {
public:
    AccountMirror(std::shared_ptr<core::IAccountStore> store, engine::TaskRuntime& runtime);

    // Fire-and-forget. Returns immediately.
    void submit(const UserId& user_id, Account snapshot);

    // Synchronous save on the calling thread, same versioning rules.
    bool saveNow(const UserId& user_id, const Account& snapshot);

    bool enabled() const { return store_ != nullptr; }
    std::size_t savedCount() const { return saved_count_; }
    std::size_t failedCount() const { return failed_count_; }
    std::size_t droppedCount() const { return dropped_count_; }

private:
    bool write(const UserId& user_id, const Account& snapshot);

    std::shared_ptr<core::IAccountStore> store_;
    engine::TaskRuntime::Strand strand_;

    std::mutex versions_mutex_;
    std::map<UserId, std::size_t> saved_versions_;

    std::atomic<std::size_t> saved_count_{0};
    std::atomic<std::size_t> failed_count_{0};
    std::atomic<std::size_t> dropped_count_{0};
};

} // namespace ledger
} // namespace papertrade
