#include "memory_tx.hpp"

#include <stdexcept>

namespace turnstile::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  snapshot_         = repo_.committed_;
  snapshot_version_ = repo_.committed_version_;
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

MemoryRepository::State& MemoryTransaction::Mutable() {
  if (!working_) {
    working_ = std::make_unique<MemoryRepository::State>(*snapshot_);
  }
  return *working_;
}

const MemoryRepository::State& MemoryTransaction::View() const {
  return working_ ? *working_ : *snapshot_;
}

void MemoryTransaction::Commit() {
  if (committed_) return;
  if (rolled_back_) {
    throw std::runtime_error("transaction already rolled back");
  }

  // nothing written, nothing to publish
  if (!working_) {
    committed_ = true;
    return;
  }

  auto next = std::make_shared<const MemoryRepository::State>(std::move(*working_));

  std::scoped_lock lock(repo_.mutex_);
  if (repo_.committed_version_ != snapshot_version_) {
    throw std::runtime_error("transaction conflict: state was modified by a concurrent transaction");
  }
  repo_.committed_ = std::move(next);
  repo_.committed_version_++;
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  working_.reset();
  rolled_back_ = true;
}

} // namespace turnstile::db::memory
