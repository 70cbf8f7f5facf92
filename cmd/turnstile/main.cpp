#include <iostream>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/guard/context.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

using turnstile::core::TransitionStatus;

namespace {

constexpr int kExitOk       = 0;
constexpr int kExitUsage    = 1;
constexpr int kExitFatal    = 2;
constexpr int kExitRejected = 3;

void Usage() {
  std::cerr << "Usage:\n"
            << "  turnstile <config.yaml> check\n"
            << "  turnstile <config.yaml> run <kind> <action> [<action>...] [--set key=value]... [--actor id[:role,role]]\n";
}

void PrintKinds(const turnstile::core::LifecycleEngine& engine) {
  for (const auto& kind : engine.Kinds()) {
    auto definition = engine.Definition(kind);
    std::cout << kind << " (initial: " << definition->initial_state() << ")\n";

    for (const auto& rule : definition->table().Rules()) {
      std::cout << "  " << rule.from << " --" << rule.action << "--> " << rule.to;
      auto guards = engine.GuardNames(kind, rule.action);
      if (!guards.empty()) {
        std::cout << "  [";
        for (size_t i = 0; i < guards.size(); ++i) {
          std::cout << (i ? ", " : "") << guards[i];
        }
        std::cout << "]";
      }
      std::cout << "\n";
    }

    for (const auto& state : definition->TerminalStates()) {
      std::cout << "  terminal: " << state << "\n";
    }
    for (const auto& name : engine.GlobalGuardNames(kind)) {
      std::cout << "  global guard: " << name << "\n";
    }
  }
}

void PrintSeededAccounts(turnstile::db::Repository& repository) {
  auto tx       = repository.Begin();
  auto accounts = repository.ListAccounts(*tx);
  std::cout << "seeded accounts: " << accounts.size() << "\n";
  for (const auto& account : accounts) {
    std::cout << "  " << account.id << " " << account.email << "\n";
  }
}

struct RunRequest {
  std::string                 kind;
  std::vector<std::string>    actions;
  turnstile::guard::Context   context;
};

// false on malformed arguments
bool ParseRun(int argc, char** argv, int first, RunRequest* request) {
  if (first >= argc) return false;
  request->kind = argv[first];

  for (int i = first + 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--set") {
      if (++i >= argc) return false;
      const std::string assignment = argv[i];
      const auto        eq         = assignment.find('=');
      if (eq == std::string::npos || eq == 0) return false;
      request->context.Set(assignment.substr(0, eq), assignment.substr(eq + 1));
    } else if (arg == "--actor") {
      if (++i >= argc) return false;
      const std::string       actor_arg = argv[i];
      const auto              colon     = actor_arg.find(':');
      turnstile::guard::Actor actor;
      actor.id = actor_arg.substr(0, colon);
      if (colon != std::string::npos) {
        std::string roles = actor_arg.substr(colon + 1);
        size_t      start = 0;
        while (start <= roles.size()) {
          const auto comma = roles.find(',', start);
          auto       role  = roles.substr(start, comma == std::string::npos ? std::string::npos : comma - start);
          if (!role.empty()) actor.roles.push_back(role);
          if (comma == std::string::npos) break;
          start = comma + 1;
        }
      }
      request->context.SetActor(std::move(actor));
    } else {
      request->actions.push_back(arg);
    }
  }
  return !request->actions.empty();
}

int Run(turnstile::core::LifecycleEngine& engine, const RunRequest& request) {
  auto entity = engine.CreateEntity(request.kind);
  std::cout << "entity " << entity->Id() << " (" << entity->Kind() << ") in " << entity->CurrentState() << "\n";

  int exit_code = kExitOk;
  for (const auto& action : request.actions) {
    auto result = entity->RequestTransitionWithRetry(action, request.context);
    std::cout << action << ": " << turnstile::core::ToString(result.status);
    switch (result.status) {
      case TransitionStatus::kCommitted:
        std::cout << " " << result.from_state << " -> " << result.state;
        break;
      case TransitionStatus::kGuardDenied:
        std::cout << " by " << result.guard_name << ": " << result.reason;
        exit_code = kExitRejected;
        break;
      case TransitionStatus::kStructurallyIllegal:
      case TransitionStatus::kConcurrencyConflict:
        std::cout << ": " << result.reason;
        exit_code = kExitRejected;
        break;
    }
    std::cout << "\n";
  }

  std::cout << "final state: " << entity->CurrentState() << " (version " << entity->Version() << ")\n";
  return exit_code;
}

} // namespace

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return kExitUsage;
  }

  const std::string config_path = argv[1];
  const std::string command     = argv[2];

  RunRequest request;
  if (command == "run") {
    if (!ParseRun(argc, argv, 3, &request)) {
      Usage();
      return kExitUsage;
    }
  } else if (command != "check" || argc != 3) {
    Usage();
    return kExitUsage;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = turnstile::config::ConfigLoader::LoadFromYaml(config_path);
    turnstile::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = turnstile::factory::Build(config);

    int exit_code = kExitOk;
    if (command == "check") {
      PrintKinds(*app.engine);
      PrintSeededAccounts(*app.repository);
    } else {
      exit_code = Run(*app.engine, request);
    }

    turnstile::observability::ShutdownLogging();
    return exit_code;
  } catch (const turnstile::util::ConfigurationError& e) {
    TURNSTILE_LOG_ERROR("Invalid lifecycle configuration", {turnstile::observability::StringField("error", e.what())});
    turnstile::observability::ShutdownLogging();
    return kExitFatal;
  } catch (const std::exception& e) {
    TURNSTILE_LOG_ERROR("Fatal error", {turnstile::observability::StringField("error", e.what())});
    turnstile::observability::ShutdownLogging();
    return kExitFatal;
  }
}
