#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/core/lifecycle_engine.hpp"
#include "internal/db/api/repository.hpp"

namespace turnstile::factory {

/*
  Application

  Owns the long-lived objects a host works with.
*/
struct Application {
  std::shared_ptr<db::Repository>        repository;
  std::shared_ptr<core::LifecycleEngine> engine;
};

/*
  Build

  Constructs the engine and its lookup repository from runtime config.

  NOTE:
  This is the composition root. It is the ONLY place allowed to know the
  concrete repository type.
*/
Application Build(const turnstile::runtime::config::RuntimeConfig& config);

} // namespace turnstile::factory
