#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/guard/guard.hpp"

namespace turnstile::db {
class Repository;
}

namespace turnstile::guard {

/*
  Builds built-in guards from configuration.

      GuardFactory factory(repository);
      chain.Add(factory.Build(guard_config));

  Unknown types, unknown params and malformed numbers raise
  ConfigurationError.
*/
class GuardFactory {
 public:
  explicit GuardFactory(std::shared_ptr<turnstile::db::Repository> repository);

  GuardPtr Build(const turnstile::runtime::config::GuardConfig& cfg) const;

 private:
  std::shared_ptr<turnstile::db::Repository> repository_;
};

} // namespace turnstile::guard
