#include "internal/core/lifecycle_engine.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace turnstile::core {

using turnstile::observability::IntField;
using turnstile::observability::StringField;
using turnstile::util::ConfigurationError;

namespace {

constexpr uint32_t kDefaultConflictAttempts = 3;

turnstile::guard::Verdict EvaluateChains(const turnstile::guard::GuardChainPtr& global_chain, const turnstile::guard::GuardChainPtr& chain,
                                         const turnstile::guard::Subject& subject, const turnstile::guard::Context& context) {
  // Snapshots are taken here, once per request.
  if (global_chain) {
    auto verdict = global_chain->Evaluate(subject, context);
    if (!verdict) return verdict;
  }
  if (chain) {
    return chain->Evaluate(subject, context);
  }
  return turnstile::guard::Verdict::Approve();
}

} // namespace

LifecycleEngine::LifecycleEngine(EngineOptions options) : options_(options), hooks_(std::make_shared<const HookList>()) {
  if (options_.max_conflict_retries == 0) {
    options_.max_conflict_retries = kDefaultConflictAttempts;
  }
}

// ------------------------------------------------------------
// Configuration
// ------------------------------------------------------------

void LifecycleEngine::RegisterKind(model::LifecycleDefinition definition) {
  std::unique_lock lock(kinds_mutex_);

  const auto name = definition.kind();
  if (kinds_.find(name) != kinds_.end()) {
    throw ConfigurationError("entity kind '" + name + "' is already registered");
  }

  KindEntry entry;
  entry.definition   = std::make_shared<const model::LifecycleDefinition>(std::move(definition));
  entry.global_chain = std::make_shared<turnstile::guard::GuardChain>();
  kinds_.emplace(name, std::move(entry));

  TURNSTILE_LOG_DEBUG("Registered entity kind", {StringField("kind", name)});
}

void LifecycleEngine::RegisterKind(std::string kind, std::vector<std::string> states, std::vector<std::string> actions, std::string initial_state) {
  RegisterKind(model::LifecycleDefinition(std::move(kind), std::move(states), std::move(actions), std::move(initial_state)));
}

void LifecycleEngine::RegisterTransition(std::string_view kind, const std::string& from, const std::string& action, const std::string& to) {
  std::unique_lock lock(kinds_mutex_);
  auto&            entry = EntryLocked(kind);

  // copy-on-write so in-flight requests keep their table
  auto next = std::make_shared<model::LifecycleDefinition>(*entry.definition);
  next->AddTransition(from, action, to);
  entry.definition = std::move(next);
}

void LifecycleEngine::RegisterGuard(std::string_view kind, const std::string& action, turnstile::guard::GuardPtr guard,
                                    turnstile::guard::GuardPosition position) {
  ActionChain(kind, action, true)->Add(std::move(guard), position);
}

void LifecycleEngine::RegisterGlobalGuard(std::string_view kind, turnstile::guard::GuardPtr guard, turnstile::guard::GuardPosition position) {
  turnstile::guard::GuardChainPtr chain;
  {
    std::shared_lock lock(kinds_mutex_);
    chain = EntryLocked(kind).global_chain;
  }
  chain->Add(std::move(guard), position);
}

void LifecycleEngine::RemoveGuard(std::string_view kind, const std::string& action, std::string_view guard_name) {
  auto chain = ActionChain(kind, action, false);
  if (!chain) {
    throw turnstile::util::NotFound("kind '" + std::string(kind) + "': no guards registered for action '" + action + "'");
  }
  chain->Remove(guard_name);
}

void LifecycleEngine::MoveGuard(std::string_view kind, const std::string& action, std::string_view guard_name, std::size_t index) {
  auto chain = ActionChain(kind, action, false);
  if (!chain) {
    throw turnstile::util::NotFound("kind '" + std::string(kind) + "': no guards registered for action '" + action + "'");
  }
  chain->Move(guard_name, index);
}

std::vector<std::string> LifecycleEngine::GuardNames(std::string_view kind, const std::string& action) const {
  std::shared_lock lock(kinds_mutex_);
  const auto&      entry = EntryLocked(kind);
  auto             it    = entry.chains.find(action);
  if (it == entry.chains.end()) return {};
  return it->second->Names();
}

std::vector<std::string> LifecycleEngine::GlobalGuardNames(std::string_view kind) const {
  std::shared_lock lock(kinds_mutex_);
  return EntryLocked(kind).global_chain->Names();
}

uint64_t LifecycleEngine::AddPostCommitHook(PostCommitHook hook) {
  if (!hook) {
    throw ConfigurationError("post-commit hook is empty");
  }

  std::lock_guard lock(hooks_mutex_);
  const auto      id   = next_hook_id_++;
  auto            next = std::make_shared<HookList>(*hooks_);
  next->emplace_back(id, std::move(hook));
  hooks_ = std::move(next);
  return id;
}

void LifecycleEngine::RemovePostCommitHook(uint64_t hook_id) {
  std::lock_guard lock(hooks_mutex_);
  auto            next = std::make_shared<HookList>(*hooks_);
  auto            it   = std::find_if(next->begin(), next->end(), [&](const auto& entry) { return entry.first == hook_id; });
  if (it == next->end()) {
    throw turnstile::util::NotFound("post-commit hook " + std::to_string(hook_id) + " is not registered");
  }
  next->erase(it);
  hooks_ = std::move(next);
}

// ------------------------------------------------------------
// Entities
// ------------------------------------------------------------

EntityPtr LifecycleEngine::CreateEntity(std::string_view kind, std::string id) {
  return CreateEntityInState(kind, Definition(kind)->initial_state(), std::move(id));
}

EntityPtr LifecycleEngine::CreateEntityInState(std::string_view kind, const std::string& state, std::string id) {
  auto definition = Definition(kind);
  if (!definition->HasState(state)) {
    throw turnstile::util::InvalidState("kind '" + definition->kind() + "': '" + state + "' is not a declared state");
  }
  if (id.empty()) {
    id = turnstile::util::NewEntityId();
  }

  // private constructor, so no make_shared
  return EntityPtr(new Entity(shared_from_this(), definition->kind(), std::move(id), state));
}

// ------------------------------------------------------------
// Requests
// ------------------------------------------------------------

TransitionResult LifecycleEngine::RequestTransition(Entity& entity, std::string_view action, const turnstile::guard::Context& context) const {
  const auto snapshot = entity.Read();
  const auto resolved = Resolve(entity.Kind(), action);

  auto to_state = resolved.definition->table().Allowed(snapshot.state, action);
  if (!to_state) {
    auto result = TransitionResult::StructurallyIllegal(std::string(action), snapshot.state, snapshot.version);
    LogRejection(entity, result);
    return result;
  }

  const turnstile::guard::Subject subject{entity.Id(), entity.Kind(), action, snapshot.state, *to_state};

  auto verdict = EvaluateChains(resolved.global_chain, resolved.chain, subject, context);
  if (!verdict) {
    auto result = TransitionResult::GuardDenied(std::string(action), snapshot.state, snapshot.version, std::move(verdict.reason),
                                                std::move(verdict.guard_name));
    LogRejection(entity, result);
    return result;
  }

  Entity::Snapshot observed;
  if (!entity.CompareAndSet(snapshot.version, *to_state, &observed)) {
    TURNSTILE_LOG_WARN("Transition lost a concurrent commit",
                       {StringField("entity_id", entity.Id()), StringField("kind", entity.Kind()), StringField("action", action),
                        StringField("from", snapshot.state), StringField("observed", observed.state)});
    return TransitionResult::ConcurrencyConflict(std::string(action), snapshot.state, observed.state, observed.version);
  }

  TURNSTILE_LOG_DEBUG("Transition committed", {StringField("entity_id", entity.Id()), StringField("kind", entity.Kind()), StringField("action", action),
                                               StringField("from", snapshot.state), StringField("to", *to_state),
                                               IntField("version", static_cast<std::int64_t>(observed.version))});

  TransitionEvent event;
  event.entity_id    = entity.Id();
  event.entity_kind  = entity.Kind();
  event.action       = std::string(action);
  event.from_state   = snapshot.state;
  event.to_state     = *to_state;
  event.version      = observed.version;
  event.committed_at = turnstile::util::Now();
  RunHooks(event);

  return TransitionResult::Committed(std::string(action), snapshot.state, std::move(*to_state), observed.version);
}

TransitionResult LifecycleEngine::RequestTransitionWithRetry(Entity& entity, std::string_view action, const turnstile::guard::Context& context,
                                                             uint32_t max_attempts) const {
  const uint32_t attempts = max_attempts == 0 ? options_.max_conflict_retries : max_attempts;

  for (uint32_t attempt = 1;; ++attempt) {
    auto result = RequestTransition(entity, action, context);
    if (result.status != TransitionStatus::kConcurrencyConflict || attempt >= attempts) {
      return result;
    }
    TURNSTILE_LOG_DEBUG("Retrying transition after conflict",
                        {StringField("entity_id", entity.Id()), StringField("action", action), IntField("attempt", attempt)});
  }
}

std::string LifecycleEngine::CurrentState(const Entity& entity) const {
  return entity.CurrentState();
}

std::vector<std::string> LifecycleEngine::AvailableActions(const Entity& entity) const {
  return Definition(entity.Kind())->table().ActionsFrom(entity.CurrentState());
}

std::optional<std::string> LifecycleEngine::AllowedTransition(std::string_view kind, std::string_view from, std::string_view action) const {
  return Definition(kind)->table().Allowed(from, action);
}

std::shared_ptr<const model::LifecycleDefinition> LifecycleEngine::Definition(std::string_view kind) const {
  std::shared_lock lock(kinds_mutex_);
  auto             it = kinds_.find(kind);
  if (it == kinds_.end()) {
    throw turnstile::util::NotFound("entity kind '" + std::string(kind) + "' is not registered");
  }
  return it->second.definition;
}

std::vector<std::string> LifecycleEngine::Kinds() const {
  std::shared_lock         lock(kinds_mutex_);
  std::vector<std::string> kinds;
  kinds.reserve(kinds_.size());
  for (const auto& [name, _] : kinds_) {
    kinds.push_back(name);
  }
  return kinds;
}

// ------------------------------------------------------------
// Internals
// ------------------------------------------------------------

LifecycleEngine::KindEntry& LifecycleEngine::EntryLocked(std::string_view kind) {
  auto it = kinds_.find(kind);
  if (it == kinds_.end()) {
    throw ConfigurationError("entity kind '" + std::string(kind) + "' is not registered");
  }
  return it->second;
}

const LifecycleEngine::KindEntry& LifecycleEngine::EntryLocked(std::string_view kind) const {
  auto it = kinds_.find(kind);
  if (it == kinds_.end()) {
    throw turnstile::util::NotFound("entity kind '" + std::string(kind) + "' is not registered");
  }
  return it->second;
}

turnstile::guard::GuardChainPtr LifecycleEngine::ActionChain(std::string_view kind, const std::string& action, bool create) {
  {
    std::shared_lock lock(kinds_mutex_);
    const auto&      entry = EntryLocked(kind);
    if (!entry.definition->HasAction(action)) {
      throw ConfigurationError("kind '" + std::string(kind) + "': guard bound to undeclared action '" + action + "'");
    }
    auto it = entry.chains.find(action);
    if (it != entry.chains.end() || !create) {
      return it == entry.chains.end() ? nullptr : it->second;
    }
  }

  std::unique_lock lock(kinds_mutex_);
  auto&            chain = EntryLocked(kind).chains[action];
  if (!chain) {
    chain = std::make_shared<turnstile::guard::GuardChain>();
  }
  return chain;
}

LifecycleEngine::Resolved LifecycleEngine::Resolve(std::string_view kind, std::string_view action) const {
  std::shared_lock lock(kinds_mutex_);

  // Entities are only created for registered kinds and kinds are never removed.
  const auto& entry = kinds_.find(kind)->second;

  Resolved resolved;
  resolved.definition   = entry.definition;
  resolved.global_chain = entry.global_chain;
  if (auto it = entry.chains.find(std::string(action)); it != entry.chains.end()) {
    resolved.chain = it->second;
  }
  return resolved;
}

void LifecycleEngine::LogRejection(const Entity& entity, const TransitionResult& result) const {
  const auto level = options_.log_rejections ? spdlog::level::info : spdlog::level::debug;
  turnstile::observability::Log(level, "Transition rejected",
                                {StringField("entity_id", entity.Id()), StringField("kind", entity.Kind()), StringField("action", result.action),
                                 StringField("state", result.state), StringField("status", ToString(result.status)),
                                 StringField("guard", result.guard_name), StringField("reason", result.reason)});
}

void LifecycleEngine::RunHooks(const TransitionEvent& event) const {
  std::shared_ptr<const HookList> hooks;
  {
    std::lock_guard lock(hooks_mutex_);
    hooks = hooks_;
  }

  for (const auto& [id, hook] : *hooks) {
    try {
      hook(event);
    } catch (const std::exception& e) {
      TURNSTILE_LOG_ERROR("Post-commit hook failed", {IntField("hook_id", static_cast<std::int64_t>(id)), StringField("entity_id", event.entity_id),
                                                      StringField("action", event.action), StringField("error", e.what())});
    } catch (...) {
      TURNSTILE_LOG_ERROR("Post-commit hook failed", {IntField("hook_id", static_cast<std::int64_t>(id)), StringField("entity_id", event.entity_id),
                                                      StringField("action", event.action), StringField("error", "unknown")});
    }
  }
}

} // namespace turnstile::core
