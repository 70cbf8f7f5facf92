#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "internal/model/transition_table.hpp"

namespace turnstile::model {

/*
  One entity kind: its closed sets of states and actions, the state new
  entities start in, and its transition table.

  Built at configuration time. Once handed to the engine it is shared
  read-only; the engine registers further transitions on a copy.
*/
class LifecycleDefinition {
 public:
  // ConfigurationError on an empty or duplicate name, or an undeclared initial state.
  LifecycleDefinition(std::string kind, std::vector<std::string> states, std::vector<std::string> actions, std::string initial_state);

  const std::string&              kind() const { return kind_; }
  const std::vector<std::string>& states() const { return states_; }
  const std::vector<std::string>& actions() const { return actions_; }
  const std::string&              initial_state() const { return initial_state_; }
  const TransitionTable&          table() const { return table_; }

  bool HasState(std::string_view state) const;
  bool HasAction(std::string_view action) const;

  // ConfigurationError on undeclared symbols or a duplicate (from, action).
  void AddTransition(const std::string& from, const std::string& action, const std::string& to);

  std::vector<std::string> TerminalStates() const;

  // States no chain of rules leads to from the initial state.
  std::vector<std::string> UnreachableStates() const;

 private:
  std::string              kind_;
  std::vector<std::string> states_;
  std::vector<std::string> actions_;
  std::string              initial_state_;
  TransitionTable          table_;
};

} // namespace turnstile::model
