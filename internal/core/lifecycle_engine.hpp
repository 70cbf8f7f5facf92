#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/core/entity.hpp"
#include "internal/core/transition_result.hpp"
#include "internal/guard/guard_chain.hpp"
#include "internal/model/lifecycle_definition.hpp"
#include "internal/util/time.hpp"

namespace turnstile::core {

struct EngineOptions {
  // Total attempts made by RequestTransitionWithRetry when the caller passes 0.
  uint32_t max_conflict_retries = 3;

  // Log rejections at info instead of debug.
  bool log_rejections = false;
};

struct TransitionEvent {
  std::string entity_id;
  std::string entity_kind;
  std::string action;
  std::string from_state;
  std::string to_state;
  uint64_t    version = 0;

  turnstile::util::TimePoint committed_at;
};

// Runs after a commit. Exceptions are logged and never roll the commit back.
using PostCommitHook = std::function<void(const TransitionEvent&)>;

/*
  LifecycleEngine

  Registry of entity kinds, their transition tables and guard chains, and
  the single place where entity state is committed.

  A request is:
    1. table lookup for (current state, action)   -> kStructurallyIllegal
    2. kind-global chain, then the action's chain -> kGuardDenied
    3. compare-and-set on the entity version       -> kConcurrencyConflict
    4. post-commit hooks

  The engine keeps no per-entity state. It must be owned by a shared_ptr
  because entities keep it alive.

  Configuration calls throw util::ConfigurationError, lookups of unknown
  kinds throw util::NotFound; request calls never throw for rejections.
*/
class LifecycleEngine : public std::enable_shared_from_this<LifecycleEngine> {
 public:
  explicit LifecycleEngine(EngineOptions options = {});

  // ---------------------------------------------------------------------
  // Configuration
  // ---------------------------------------------------------------------

  void RegisterKind(model::LifecycleDefinition definition);
  void RegisterKind(std::string kind, std::vector<std::string> states, std::vector<std::string> actions, std::string initial_state);

  void RegisterTransition(std::string_view kind, const std::string& from, const std::string& action, const std::string& to);

  void RegisterGuard(std::string_view kind, const std::string& action, turnstile::guard::GuardPtr guard,
                     turnstile::guard::GuardPosition position = turnstile::guard::GuardPosition::Append());

  // Runs before the action chains of every action of the kind.
  void RegisterGlobalGuard(std::string_view kind, turnstile::guard::GuardPtr guard,
                           turnstile::guard::GuardPosition position = turnstile::guard::GuardPosition::Append());

  void RemoveGuard(std::string_view kind, const std::string& action, std::string_view guard_name);
  void MoveGuard(std::string_view kind, const std::string& action, std::string_view guard_name, std::size_t index);

  std::vector<std::string> GuardNames(std::string_view kind, const std::string& action) const;
  std::vector<std::string> GlobalGuardNames(std::string_view kind) const;

  uint64_t AddPostCommitHook(PostCommitHook hook);
  void     RemovePostCommitHook(uint64_t hook_id);

  // ---------------------------------------------------------------------
  // Entities
  // ---------------------------------------------------------------------

  // Starts in the kind's initial state. An empty id gets a fresh UUID.
  EntityPtr CreateEntity(std::string_view kind, std::string id = {});

  // util::InvalidState if `state` is not declared on the kind.
  EntityPtr CreateEntityInState(std::string_view kind, const std::string& state, std::string id = {});

  // ---------------------------------------------------------------------
  // Requests
  // ---------------------------------------------------------------------

  TransitionResult RequestTransition(Entity& entity, std::string_view action, const turnstile::guard::Context& context) const;

  // Re-evaluates from scratch after kConcurrencyConflict, at most `max_attempts` times in total.
  TransitionResult RequestTransitionWithRetry(Entity& entity, std::string_view action, const turnstile::guard::Context& context,
                                              uint32_t max_attempts = 0) const;

  std::string CurrentState(const Entity& entity) const;

  std::vector<std::string> AvailableActions(const Entity& entity) const;

  std::optional<std::string> AllowedTransition(std::string_view kind, std::string_view from, std::string_view action) const;

  // util::NotFound for unknown kinds.
  std::shared_ptr<const model::LifecycleDefinition> Definition(std::string_view kind) const;

  std::vector<std::string> Kinds() const;

  const EngineOptions& options() const {
    return options_;
  }

 private:
  struct KindEntry {
    std::shared_ptr<const model::LifecycleDefinition>             definition;
    turnstile::guard::GuardChainPtr                               global_chain;
    std::unordered_map<std::string, turnstile::guard::GuardChainPtr> chains;
  };

  struct Resolved {
    std::shared_ptr<const model::LifecycleDefinition> definition;
    turnstile::guard::GuardChainPtr                   global_chain;
    turnstile::guard::GuardChainPtr                   chain;
  };

  using HookList = std::vector<std::pair<uint64_t, PostCommitHook>>;

  // Registration paths: ConfigurationError for an unknown kind. Read paths: NotFound.
  KindEntry&       EntryLocked(std::string_view kind);
  const KindEntry& EntryLocked(std::string_view kind) const;

  turnstile::guard::GuardChainPtr ActionChain(std::string_view kind, const std::string& action, bool create);

  Resolved Resolve(std::string_view kind, std::string_view action) const;

  void LogRejection(const Entity& entity, const TransitionResult& result) const;
  void RunHooks(const TransitionEvent& event) const;

  EngineOptions options_;

  mutable std::shared_mutex                     kinds_mutex_;
  std::map<std::string, KindEntry, std::less<>> kinds_;

  mutable std::mutex              hooks_mutex_;
  std::shared_ptr<const HookList> hooks_;
  uint64_t                        next_hook_id_ = 1;
};

} // namespace turnstile::core
