#include "internal/model/transition_table.hpp"

#include "internal/util/errors.hpp"

namespace turnstile::model {

void TransitionTable::Add(const std::string& from, const std::string& action, const std::string& to) {
  auto& actions = rules_[from];
  auto  [it, inserted] = actions.emplace(action, to);
  if (!inserted) {
    throw turnstile::util::ConfigurationError("duplicate transition: '" + from + "' --" + action + "--> already leads to '" + it->second + "'");
  }
  ++size_;
}

std::optional<std::string> TransitionTable::Allowed(std::string_view from, std::string_view action) const {
  auto state_it = rules_.find(from);
  if (state_it == rules_.end()) return std::nullopt;

  auto action_it = state_it->second.find(action);
  if (action_it == state_it->second.end()) return std::nullopt;
  return action_it->second;
}

bool TransitionTable::IsTerminal(std::string_view state) const {
  auto it = rules_.find(state);
  return it == rules_.end() || it->second.empty();
}

std::vector<std::string> TransitionTable::ActionsFrom(std::string_view state) const {
  std::vector<std::string> actions;
  auto                     it = rules_.find(state);
  if (it == rules_.end()) return actions;

  actions.reserve(it->second.size());
  for (const auto& [action, _] : it->second) {
    actions.push_back(action);
  }
  return actions;
}

std::vector<TransitionRule> TransitionTable::Rules() const {
  std::vector<TransitionRule> rules;
  rules.reserve(size_);
  for (const auto& [from, actions] : rules_) {
    for (const auto& [action, to] : actions) {
      rules.push_back({from, action, to});
    }
  }
  return rules;
}

std::size_t TransitionTable::size() const {
  return size_;
}

} // namespace turnstile::model
