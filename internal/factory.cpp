#include "factory.hpp"

#include <memory>

#include "internal/config/lifecycle_config.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/guard/guard_factory.hpp"

namespace turnstile::factory {

/*
    Build full application dependency graph
*/
Application Build(const turnstile::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Lookup repository
  // ------------------------------------------------------------------
  app.repository = std::make_shared<db::memory::MemoryRepository>();
  turnstile::config::SeedRepository(*app.repository, config.repository());

  // ------------------------------------------------------------------
  // Engine + lifecycles
  // ------------------------------------------------------------------
  app.engine = std::make_shared<core::LifecycleEngine>(turnstile::config::ToEngineOptions(config.engine()));

  guard::GuardFactory guards(app.repository);
  turnstile::config::ApplyLifecycleConfig(*app.engine, config, guards);

  return app;
}

} // namespace turnstile::factory
