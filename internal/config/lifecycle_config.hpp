#pragma once

#include "config/config.pb.h"
#include "internal/core/lifecycle_engine.hpp"

namespace turnstile::db {
class Repository;
}

namespace turnstile::guard {
class GuardFactory;
}

namespace turnstile::config {

/*
  Turns the declarative parts of RuntimeConfig into engine registrations.

  All functions throw util::ConfigurationError with the offending kind,
  action or guard in the message. They run at startup only.
*/

core::EngineOptions ToEngineOptions(const turnstile::runtime::config::EngineConfig& config);

// Inserts seed accounts and referral codes in one transaction. A referral code
// owner, when given, must be one of the seeded accounts.
void SeedRepository(turnstile::db::Repository& repository, const turnstile::runtime::config::RepositoryConfig& config);

void ApplyLifecycleConfig(core::LifecycleEngine& engine, const turnstile::runtime::config::RuntimeConfig& config,
                          const turnstile::guard::GuardFactory& guards);

} // namespace turnstile::config
