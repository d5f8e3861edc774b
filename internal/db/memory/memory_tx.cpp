#include "memory_tx.hpp"

#include <mutex>

#include "internal/util/errors.hpp"

namespace cms::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_      = repo_.committed_;
  base_version_ = repo_.committed_version_;
}

void MemoryTransaction::Commit() {
  if (phase_ != Phase::kOpen) {
    throw util::InvalidState("memory transaction already finished");
  }

  std::scoped_lock lock(repo_.mutex_);
  if (repo_.committed_version_ != base_version_) {
    phase_ = Phase::kRolledBack;
    throw util::InvalidState("memory transaction lost a race with a concurrent commit");
  }
  repo_.committed_ = std::move(working_);
  ++repo_.committed_version_;
  phase_ = Phase::kCommitted;
}

// Nothing was published; dropping the working copy is enough.
void MemoryTransaction::Rollback() {
  if (phase_ == Phase::kOpen) phase_ = Phase::kRolledBack;
}

} // namespace cms::db::memory
