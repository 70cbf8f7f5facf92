#include "internal/core/entity.hpp"

#include "internal/core/lifecycle_engine.hpp"

namespace turnstile::core {

Entity::Entity(std::shared_ptr<const LifecycleEngine> engine, std::string kind, std::string id, std::string initial_state)
    : engine_(std::move(engine)), kind_(std::move(kind)), id_(std::move(id)), state_(std::move(initial_state)) {
}

std::string Entity::CurrentState() const {
  std::lock_guard lock(mutex_);
  return state_;
}

uint64_t Entity::Version() const {
  std::lock_guard lock(mutex_);
  return version_;
}

TransitionResult Entity::RequestTransition(std::string_view action, const turnstile::guard::Context& context) {
  return engine_->RequestTransition(*this, action, context);
}

TransitionResult Entity::RequestTransitionWithRetry(std::string_view action, const turnstile::guard::Context& context, uint32_t max_attempts) {
  return engine_->RequestTransitionWithRetry(*this, action, context, max_attempts);
}

std::vector<std::string> Entity::AvailableActions() const {
  return engine_->AvailableActions(*this);
}

Entity::Snapshot Entity::Read() const {
  std::lock_guard lock(mutex_);
  return {state_, version_};
}

bool Entity::CompareAndSet(uint64_t expected_version, const std::string& to_state, Snapshot* observed) {
  std::lock_guard lock(mutex_);
  if (version_ != expected_version) {
    if (observed) *observed = {state_, version_};
    return false;
  }

  state_ = to_state;
  ++version_;
  if (observed) *observed = {state_, version_};
  return true;
}

} // namespace turnstile::core
