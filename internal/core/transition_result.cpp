#include "internal/core/transition_result.hpp"

namespace turnstile::core {

std::string_view ToString(TransitionStatus status) {
  switch (status) {
    case TransitionStatus::kCommitted:
      return "committed";
    case TransitionStatus::kStructurallyIllegal:
      return "structurally_illegal";
    case TransitionStatus::kGuardDenied:
      return "guard_denied";
    case TransitionStatus::kConcurrencyConflict:
      return "concurrency_conflict";
  }
  return "unknown";
}

TransitionResult TransitionResult::Committed(std::string action, std::string from_state, std::string to_state, uint64_t version) {
  TransitionResult result;
  result.status     = TransitionStatus::kCommitted;
  result.action     = std::move(action);
  result.from_state = std::move(from_state);
  result.state      = std::move(to_state);
  result.version    = version;
  return result;
}

TransitionResult TransitionResult::StructurallyIllegal(std::string action, std::string state, uint64_t version) {
  TransitionResult result;
  result.status     = TransitionStatus::kStructurallyIllegal;
  result.reason     = "no transition for action '" + action + "' from state '" + state + "'";
  result.action     = std::move(action);
  result.from_state = state;
  result.state      = std::move(state);
  result.version    = version;
  return result;
}

TransitionResult TransitionResult::GuardDenied(std::string action, std::string state, uint64_t version, std::string reason, std::string guard_name) {
  TransitionResult result;
  result.status     = TransitionStatus::kGuardDenied;
  result.action     = std::move(action);
  result.from_state = state;
  result.state      = std::move(state);
  result.version    = version;
  result.reason     = std::move(reason);
  result.guard_name = std::move(guard_name);
  return result;
}

TransitionResult TransitionResult::ConcurrencyConflict(std::string action, std::string from_state, std::string observed_state,
                                                       uint64_t observed_version) {
  TransitionResult result;
  result.status     = TransitionStatus::kConcurrencyConflict;
  result.reason     = "entity changed concurrently; now in state '" + observed_state + "'";
  result.action     = std::move(action);
  result.from_state = std::move(from_state);
  result.state      = std::move(observed_state);
  result.version    = observed_version;
  return result;
}

} // namespace turnstile::core
