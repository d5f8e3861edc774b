#pragma once

#include <cstdint>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace cms::db::memory {

/*
  Works on a private copy of the repository state taken at Begin().
  Commit publishes the copy only if nobody else committed since then;
  otherwise it throws util::InvalidState and the copy is discarded.
*/
class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return phase_ == Phase::kCommitted;
  }

  MemoryRepository::State& Mutable() {
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  enum class Phase { kOpen, kCommitted, kRolledBack };

  MemoryRepository&       repo_;
  MemoryRepository::State working_;
  uint64_t                base_version_ = 0;
  Phase                   phase_        = Phase::kOpen;
};

} // namespace cms::db::memory
