#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "internal/core/transition_result.hpp"
#include "internal/guard/context.hpp"

namespace turnstile::core {

class LifecycleEngine;

/*
  The thing whose lifecycle is managed.

  Created only through LifecycleEngine::CreateEntity, always with an
  explicit state. State changes only through a committed transition; there
  is no setter. The version counts commits and fences concurrent requests.
*/
class Entity {
 public:
  Entity(const Entity&)            = delete;
  Entity& operator=(const Entity&) = delete;

  const std::string& Id() const {
    return id_;
  }

  const std::string& Kind() const {
    return kind_;
  }

  std::string CurrentState() const;
  uint64_t    Version() const;

  TransitionResult RequestTransition(std::string_view action, const turnstile::guard::Context& context = {});

  // 0 attempts = engine default.
  TransitionResult RequestTransitionWithRetry(std::string_view action, const turnstile::guard::Context& context = {}, uint32_t max_attempts = 0);

  std::vector<std::string> AvailableActions() const;

 private:
  friend class LifecycleEngine;

  struct Snapshot {
    std::string state;
    uint64_t    version = 0;
  };

  Entity(std::shared_ptr<const LifecycleEngine> engine, std::string kind, std::string id, std::string initial_state);

  Snapshot Read() const;

  // Commits `to_state` only if no other commit happened since `expected_version`.
  // `observed` receives the state after the attempt either way.
  bool CompareAndSet(uint64_t expected_version, const std::string& to_state, Snapshot* observed);

  std::shared_ptr<const LifecycleEngine> engine_;
  const std::string                      kind_;
  const std::string                      id_;

  mutable std::mutex mutex_;
  std::string        state_;
  uint64_t           version_ = 0;
};

using EntityPtr = std::shared_ptr<Entity>;

} // namespace turnstile::core
