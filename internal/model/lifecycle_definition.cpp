#include "internal/model/lifecycle_definition.hpp"

#include <algorithm>
#include <queue>
#include <set>

#include "internal/util/errors.hpp"

namespace turnstile::model {

using turnstile::util::ConfigurationError;

namespace {

void CheckSymbols(const std::string& kind, const char* what, const std::vector<std::string>& symbols) {
  std::set<std::string_view> seen;
  for (const auto& symbol : symbols) {
    if (symbol.empty()) {
      throw ConfigurationError("kind '" + kind + "': empty " + what + " name");
    }
    if (!seen.insert(symbol).second) {
      throw ConfigurationError("kind '" + kind + "': duplicate " + what + " '" + symbol + "'");
    }
  }
}

bool Contains(const std::vector<std::string>& symbols, std::string_view symbol) {
  return std::find(symbols.begin(), symbols.end(), symbol) != symbols.end();
}

} // namespace

LifecycleDefinition::LifecycleDefinition(std::string kind, std::vector<std::string> states, std::vector<std::string> actions,
                                         std::string initial_state)
    : kind_(std::move(kind)), states_(std::move(states)), actions_(std::move(actions)), initial_state_(std::move(initial_state)) {
  if (kind_.empty()) {
    throw ConfigurationError("entity kind name is empty");
  }
  if (states_.empty()) {
    throw ConfigurationError("kind '" + kind_ + "': declares no states");
  }
  CheckSymbols(kind_, "state", states_);
  CheckSymbols(kind_, "action", actions_);

  if (initial_state_.empty()) {
    throw ConfigurationError("kind '" + kind_ + "': missing initial state");
  }
  if (!HasState(initial_state_)) {
    throw ConfigurationError("kind '" + kind_ + "': initial state '" + initial_state_ + "' is not a declared state");
  }
}

bool LifecycleDefinition::HasState(std::string_view state) const {
  return Contains(states_, state);
}

bool LifecycleDefinition::HasAction(std::string_view action) const {
  return Contains(actions_, action);
}

void LifecycleDefinition::AddTransition(const std::string& from, const std::string& action, const std::string& to) {
  if (!HasState(from)) {
    throw ConfigurationError("kind '" + kind_ + "': transition from undeclared state '" + from + "'");
  }
  if (!HasAction(action)) {
    throw ConfigurationError("kind '" + kind_ + "': transition on undeclared action '" + action + "'");
  }
  if (!HasState(to)) {
    throw ConfigurationError("kind '" + kind_ + "': transition to undeclared state '" + to + "'");
  }
  table_.Add(from, action, to);
}

std::vector<std::string> LifecycleDefinition::TerminalStates() const {
  std::vector<std::string> terminal;
  for (const auto& state : states_) {
    if (table_.IsTerminal(state)) terminal.push_back(state);
  }
  return terminal;
}

std::vector<std::string> LifecycleDefinition::UnreachableStates() const {
  std::set<std::string>   reached{initial_state_};
  std::queue<std::string> pending;
  pending.push(initial_state_);

  while (!pending.empty()) {
    const auto state = pending.front();
    pending.pop();
    for (const auto& action : table_.ActionsFrom(state)) {
      auto to = table_.Allowed(state, action);
      if (to && reached.insert(*to).second) pending.push(*to);
    }
  }

  std::vector<std::string> unreachable;
  for (const auto& state : states_) {
    if (!reached.contains(state)) unreachable.push_back(state);
  }
  return unreachable;
}

} // namespace turnstile::model
