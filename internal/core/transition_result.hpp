#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace turnstile::core {

enum class TransitionStatus {
  kCommitted = 0,

  // No rule for (current state, action). Caller bug or stale state; never retried.
  kStructurallyIllegal,

  // A named guard vetoed; reason and guard_name are set.
  kGuardDenied,

  // Another request committed first; state is what that commit left behind.
  kConcurrencyConflict,
};

std::string_view ToString(TransitionStatus status);

/*
  Outcome of one transition request.

  Rejections are ordinary values, the engine never throws for them.
  `state` is the entity state as this request last observed it: the new
  state on commit, the unchanged state on rejection.
*/
struct TransitionResult {
  TransitionStatus status = TransitionStatus::kStructurallyIllegal;

  std::string action;
  std::string from_state;
  std::string state;

  std::string reason;
  std::string guard_name;

  uint64_t version = 0;

  static TransitionResult Committed(std::string action, std::string from_state, std::string to_state, uint64_t version);
  static TransitionResult StructurallyIllegal(std::string action, std::string state, uint64_t version);
  static TransitionResult GuardDenied(std::string action, std::string state, uint64_t version, std::string reason, std::string guard_name);
  static TransitionResult ConcurrencyConflict(std::string action, std::string from_state, std::string observed_state, uint64_t observed_version);

  bool committed() const {
    return status == TransitionStatus::kCommitted;
  }

  explicit operator bool() const {
    return committed();
  }
};

} // namespace turnstile::core
