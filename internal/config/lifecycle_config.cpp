#include "internal/config/lifecycle_config.hpp"

#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/guard/guard_factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace turnstile::config {

using turnstile::observability::BoolField;
using turnstile::observability::IntField;
using turnstile::observability::StringField;
using turnstile::runtime::config::EntityKindConfig;
using turnstile::util::ConfigurationError;

namespace {

std::vector<std::string> ToVector(const google::protobuf::RepeatedPtrField<std::string>& values) {
  return std::vector<std::string>(values.begin(), values.end());
}

std::string Join(const std::vector<std::string>& values) {
  std::string joined;
  for (const auto& value : values) {
    if (!joined.empty()) joined += ",";
    joined += value;
  }
  return joined;
}

void ApplyKind(core::LifecycleEngine& engine, const EntityKindConfig& kind, const turnstile::guard::GuardFactory& guards) {
  engine.RegisterKind(kind.name(), ToVector(kind.states()), ToVector(kind.actions()), kind.initial_state());

  for (const auto& transition : kind.transitions()) {
    engine.RegisterTransition(kind.name(), transition.from(), transition.action(), transition.to());
  }

  for (const auto& guard : kind.global_guards()) {
    engine.RegisterGlobalGuard(kind.name(), guards.Build(guard));
  }

  for (const auto& chain : kind.chains()) {
    for (const auto& guard : chain.guards()) {
      engine.RegisterGuard(kind.name(), chain.action(), guards.Build(guard));
    }
  }

  auto definition = engine.Definition(kind.name());
  if (auto unreachable = definition->UnreachableStates(); !unreachable.empty()) {
    TURNSTILE_LOG_WARN("Entity kind has unreachable states", {StringField("kind", kind.name()), StringField("states", Join(unreachable))});
  }

  TURNSTILE_LOG_INFO("Entity kind configured", {StringField("kind", kind.name()), IntField("states", kind.states_size()),
                                                IntField("transitions", static_cast<std::int64_t>(definition->table().size())),
                                                StringField("terminal", Join(definition->TerminalStates())),
                                                BoolField("global_guards", kind.global_guards_size() > 0)});
}

} // namespace

core::EngineOptions ToEngineOptions(const turnstile::runtime::config::EngineConfig& config) {
  core::EngineOptions options;
  if (config.max_conflict_retries() > 0) {
    options.max_conflict_retries = config.max_conflict_retries();
  }
  options.log_rejections = config.log_rejections();
  return options;
}

void SeedRepository(turnstile::db::Repository& repository, const turnstile::runtime::config::RepositoryConfig& config) {
  auto       tx  = repository.Begin();
  const auto now = turnstile::util::ToUnixMillis(turnstile::util::Now());

  try {
    for (const auto& seed : config.seed_accounts()) {
      turnstile::db::model::AccountRecord record;
      record.id            = seed.id();
      record.email         = seed.email();
      record.created_at_ms = now;
      turnstile::db::ThrowIfDbError(repository.InsertAccount(*tx, record), "seed account");
    }

    for (const auto& seed : config.seed_referral_codes()) {
      turnstile::db::model::ReferralCodeRecord record;
      record.code             = seed.code();
      record.owner_account_id = seed.owner_account_id();
      record.max_uses         = seed.max_uses();
      if (!record.owner_account_id.empty() && !repository.GetAccount(*tx, record.owner_account_id).has_value()) {
        throw ConfigurationError("referral code '" + record.code + "': owner account '" + record.owner_account_id + "' is not seeded");
      }
      turnstile::db::ThrowIfDbError(repository.InsertReferralCode(*tx, record), "seed referral code");
    }
  } catch (const std::exception& e) {
    throw ConfigurationError(std::string("repository seed: ") + e.what());
  }

  tx->Commit();
}

void ApplyLifecycleConfig(core::LifecycleEngine& engine, const turnstile::runtime::config::RuntimeConfig& config,
                          const turnstile::guard::GuardFactory& guards) {
  for (const auto& kind : config.entity_kinds()) {
    try {
      ApplyKind(engine, kind, guards);
    } catch (const ConfigurationError& e) {
      throw ConfigurationError("entity kind '" + kind.name() + "': " + e.what());
    }
  }
}

} // namespace turnstile::config
