#include "internal/model/transition_table.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/model/lifecycle_definition.hpp"
#include "internal/util/errors.hpp"

namespace {

using turnstile::model::LifecycleDefinition;
using turnstile::model::TransitionTable;
using turnstile::util::ConfigurationError;

LifecycleDefinition MakeArticle() {
  LifecycleDefinition definition("article", {"draft", "moderation", "published"}, {"submit_for_review", "publish", "reject"}, "draft");
  definition.AddTransition("draft", "submit_for_review", "moderation");
  definition.AddTransition("moderation", "publish", "published");
  definition.AddTransition("moderation", "reject", "draft");
  return definition;
}

template <typename Fn>
bool ThrowsConfigurationError(Fn&& fn) {
  try {
    fn();
  } catch (const ConfigurationError&) {
    return true;
  }
  return false;
}

void TestAllowedReturnsTargetOrNothing() {
  TransitionTable table;
  table.Add("draft", "submit_for_review", "moderation");
  table.Add("moderation", "publish", "published");

  assert(table.Allowed("draft", "submit_for_review") == std::string("moderation"));
  assert(!table.Allowed("draft", "publish").has_value());
  assert(!table.Allowed("published", "publish").has_value());
  assert(!table.Allowed("unknown", "submit_for_review").has_value());
  assert(table.size() == 2);
}

bool SameRules(const std::vector<turnstile::model::TransitionRule>& a, const std::vector<turnstile::model::TransitionRule>& b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (a[i].from != b[i].from || a[i].action != b[i].action || a[i].to != b[i].to) return false;
  }
  return true;
}

void TestLookupsAreIdempotent() {
  auto        definition = MakeArticle();
  const auto& table      = definition.table();

  const auto rules_before = table.Rules();
  const auto size_before  = table.size();

  const auto first  = table.Allowed("moderation", "publish");
  const auto second = table.Allowed("moderation", "publish");
  assert(first.has_value() && second.has_value());
  assert(*first == *second && *first == "published");

  const auto missing_first  = table.Allowed("draft", "publish");
  const auto missing_second = table.Allowed("draft", "publish");
  assert(!missing_first.has_value() && !missing_second.has_value());

  assert(table.IsTerminal("published") == table.IsTerminal("published"));
  assert(table.ActionsFrom("moderation") == table.ActionsFrom("moderation"));

  assert(table.size() == size_before);
  assert(SameRules(table.Rules(), rules_before));
}

void TestDuplicatePairIsRejected() {
  TransitionTable table;
  table.Add("draft", "submit_for_review", "moderation");

  assert(ThrowsConfigurationError([&] { table.Add("draft", "submit_for_review", "published"); }));
  assert(table.Allowed("draft", "submit_for_review") == std::string("moderation"));
  assert(table.size() == 1);
}

void TestSameActionFromDifferentStates() {
  TransitionTable table;
  table.Add("draft", "archive", "archived");
  table.Add("published", "archive", "archived");

  assert(table.Allowed("draft", "archive") == std::string("archived"));
  assert(table.Allowed("published", "archive") == std::string("archived"));
}

void TestTerminalStatesAndActionsFrom() {
  auto definition = MakeArticle();

  const auto& table = definition.table();
  assert(table.IsTerminal("published"));
  assert(!table.IsTerminal("draft"));

  const auto actions = table.ActionsFrom("moderation");
  assert(actions.size() == 2);
  assert(actions[0] == "publish");
  assert(actions[1] == "reject");
  assert(table.ActionsFrom("published").empty());

  const auto terminal = definition.TerminalStates();
  assert(terminal.size() == 1 && terminal[0] == "published");
}

void TestRulesAreSorted() {
  auto       definition = MakeArticle();
  const auto rules      = definition.table().Rules();

  assert(rules.size() == 3);
  assert(rules[0].from == "draft" && rules[0].action == "submit_for_review" && rules[0].to == "moderation");
  assert(rules[1].from == "moderation" && rules[1].action == "publish");
  assert(rules[2].from == "moderation" && rules[2].action == "reject" && rules[2].to == "draft");
}

void TestDefinitionRejectsBadDeclarations() {
  assert(ThrowsConfigurationError([] { LifecycleDefinition("", {"a"}, {"go"}, "a"); }));
  assert(ThrowsConfigurationError([] { LifecycleDefinition("k", {"a", "a"}, {"go"}, "a"); }));
  assert(ThrowsConfigurationError([] { LifecycleDefinition("k", {"a"}, {"go", "go"}, "a"); }));
  assert(ThrowsConfigurationError([] { LifecycleDefinition("k", {"a"}, {"go"}, "b"); }));
  assert(ThrowsConfigurationError([] { LifecycleDefinition("k", {"a"}, {"go"}, ""); }));
}

void TestAddTransitionRejectsUndeclaredSymbols() {
  auto definition = MakeArticle();

  assert(ThrowsConfigurationError([&] { definition.AddTransition("archived", "publish", "published"); }));
  assert(ThrowsConfigurationError([&] { definition.AddTransition("draft", "archive", "published"); }));
  assert(ThrowsConfigurationError([&] { definition.AddTransition("draft", "publish", "gone"); }));
  assert(ThrowsConfigurationError([&] { definition.AddTransition("moderation", "publish", "draft"); }));
  assert(definition.table().size() == 3);
}

void TestUnreachableStates() {
  LifecycleDefinition definition("order", {"new", "paid", "shipped", "lost"}, {"pay", "ship"}, "new");
  definition.AddTransition("new", "pay", "paid");
  definition.AddTransition("paid", "ship", "shipped");

  const auto unreachable = definition.UnreachableStates();
  assert(unreachable.size() == 1);
  assert(unreachable[0] == "lost");

  assert(MakeArticle().UnreachableStates().empty());
}

} // namespace

int main() {
  TestAllowedReturnsTargetOrNothing();
  TestLookupsAreIdempotent();
  TestDuplicatePairIsRejected();
  TestSameActionFromDifferentStates();
  TestTerminalStatesAndActionsFrom();
  TestRulesAreSorted();
  TestDefinitionRejectsBadDeclarations();
  TestAddTransitionRejectsUndeclaredSymbols();
  TestUnreachableStates();

  std::cout << "turnstile_unit_transition_table: pass\n";
  return 0;
}
