#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace turnstile::model {

struct TransitionRule {
  std::string from;
  std::string action;
  std::string to;
};

/*
  (from state, action) -> to state.

  A partial function: at most one rule per (from, action) and an absent
  pair means the action is structurally illegal from that state. Pure data,
  lookups have no side effects.
*/
class TransitionTable {
 public:
  // ConfigurationError when (from, action) already has a rule.
  void Add(const std::string& from, const std::string& action, const std::string& to);

  std::optional<std::string> Allowed(std::string_view from, std::string_view action) const;

  // A state with no outgoing rule.
  bool IsTerminal(std::string_view state) const;

  std::vector<std::string>    ActionsFrom(std::string_view state) const;
  std::vector<TransitionRule> Rules() const;
  std::size_t                 size() const;

 private:
  using ActionMap = std::map<std::string, std::string, std::less<>>;

  std::map<std::string, ActionMap, std::less<>> rules_;
  std::size_t                                   size_ = 0;
};

} // namespace turnstile::model
