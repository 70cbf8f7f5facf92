#pragma once

#include <cstdint>
#include <memory>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace turnstile::db::memory {

/*
  Transaction = shared snapshot + private write set.

  Begin() only takes a reference to the published state. The first write
  copies it; read-only transactions never copy.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State&       Mutable();
  const MemoryRepository::State& View() const;

 private:
  MemoryRepository&                              repo_;
  std::shared_ptr<const MemoryRepository::State> snapshot_;
  std::unique_ptr<MemoryRepository::State>       working_;
  uint64_t                                       snapshot_version_ = 0;
  bool                                           committed_        = false;
  bool                                           rolled_back_      = false;
};

} // namespace turnstile::db::memory
