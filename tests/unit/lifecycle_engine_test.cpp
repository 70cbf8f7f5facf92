#include "internal/core/lifecycle_engine.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/guard/builtin_guards.hpp"
#include "internal/util/errors.hpp"

namespace {

using turnstile::core::EntityPtr;
using turnstile::core::LifecycleEngine;
using turnstile::core::TransitionEvent;
using turnstile::core::TransitionStatus;
using turnstile::guard::Context;
using turnstile::guard::FunctionGuard;
using turnstile::guard::Subject;
using turnstile::guard::Verdict;

std::shared_ptr<LifecycleEngine> MakeArticleEngine() {
  auto engine = std::make_shared<LifecycleEngine>();
  engine->RegisterKind("article", {"draft", "moderation", "published"}, {"submit_for_review", "publish", "reject", "moderation"}, "draft");
  engine->RegisterTransition("article", "draft", "submit_for_review", "moderation");
  engine->RegisterTransition("article", "moderation", "publish", "published");
  engine->RegisterTransition("article", "moderation", "reject", "draft");
  return engine;
}

turnstile::guard::GuardPtr Deny(const std::string& name, const std::string& reason, int* calls = nullptr) {
  return std::make_shared<FunctionGuard>(name, [reason, calls](const Subject&, const Context&) {
    if (calls) ++*calls;
    return Verdict::Deny(reason);
  });
}

turnstile::guard::GuardPtr Approve(const std::string& name, int* calls) {
  return std::make_shared<FunctionGuard>(name, [calls](const Subject&, const Context&) {
    ++*calls;
    return Verdict::Approve();
  });
}

void TestCommitWithEmptyChain() {
  auto engine  = MakeArticleEngine();
  auto article = engine->CreateEntity("article", "a-1");

  assert(article->CurrentState() == "draft");
  assert(article->Version() == 0);

  auto result = article->RequestTransition("submit_for_review");
  assert(result.committed());
  assert(result.status == TransitionStatus::kCommitted);
  assert(result.from_state == "draft");
  assert(result.state == "moderation");
  assert(result.version == 1);
  assert(article->CurrentState() == "moderation");
  assert(engine->CurrentState(*article) == "moderation");
}

void TestMissingRuleIsStructurallyIllegal() {
  auto engine  = MakeArticleEngine();
  auto article = engine->CreateEntity("article");

  auto result = article->RequestTransition("publish");
  assert(!result);
  assert(result.status == TransitionStatus::kStructurallyIllegal);
  assert(result.state == "draft");
  assert(result.reason == "no transition for action 'publish' from state 'draft'");
  assert(result.guard_name.empty());
  assert(article->CurrentState() == "draft");
  assert(article->Version() == 0);
}

void TestStructuralCheckPrecedesGuards() {
  auto engine = MakeArticleEngine();
  int  calls  = 0;
  engine->RegisterGuard("article", "moderation", Deny("ModerationGuard", "never", &calls));
  engine->RegisterGlobalGuard("article", Approve("Everyone", &calls));

  auto article = engine->CreateEntityInState("article", "published");
  auto result  = article->RequestTransition("moderation");

  assert(result.status == TransitionStatus::kStructurallyIllegal);
  assert(calls == 0);
  assert(article->CurrentState() == "published");
}

void TestGuardDenialCarriesNameAndReason() {
  auto engine = std::make_shared<LifecycleEngine>();
  engine->RegisterKind("registration", {"submitted", "registered"}, {"register"}, "submitted");
  engine->RegisterTransition("registration", "submitted", "register", "registered");

  int password_calls = 0;
  int referral_calls = 0;
  engine->RegisterGuard("registration", "register", Deny("EmailExistsGuard", "email exists"));
  engine->RegisterGuard("registration", "register", Approve("PasswordGuard", &password_calls));
  engine->RegisterGuard("registration", "register", Approve("ReferralGuard", &referral_calls));

  auto request = engine->CreateEntity("registration");
  auto result  = request->RequestTransition("register");

  assert(result.status == TransitionStatus::kGuardDenied);
  assert(result.reason == "email exists");
  assert(result.guard_name == "EmailExistsGuard");
  assert(result.state == "submitted");
  assert(password_calls == 0);
  assert(referral_calls == 0);
  assert(request->Version() == 0);
}

void TestGlobalChainRunsFirst() {
  auto engine = MakeArticleEngine();
  int  action_calls = 0;
  engine->RegisterGlobalGuard("article", std::make_shared<turnstile::guard::AuthGuard>());
  engine->RegisterGuard("article", "submit_for_review", Approve("Counter", &action_calls));

  auto article = engine->CreateEntity("article");

  auto anonymous = article->RequestTransition("submit_for_review");
  assert(anonymous.status == TransitionStatus::kGuardDenied);
  assert(anonymous.guard_name == "AuthGuard");
  assert(action_calls == 0);

  Context context;
  context.SetActor({"alice", {}});
  assert(article->RequestTransition("submit_for_review", context).committed());
  assert(action_calls == 1);
  assert((engine->GlobalGuardNames("article") == std::vector<std::string>{"AuthGuard"}));
}

void TestGuardsOnlyApplyToTheirAction() {
  auto engine = MakeArticleEngine();
  engine->RegisterGuard("article", "publish", std::make_shared<turnstile::guard::RoleGuard>("moderator"));

  auto article = engine->CreateEntity("article");
  assert(article->RequestTransition("submit_for_review").committed());

  auto denied = article->RequestTransition("publish");
  assert(denied.guard_name == "RoleGuard");
  assert(article->RequestTransition("reject").committed());
  assert(article->CurrentState() == "draft");
}

void TestGuardReconfigurationAtRuntime() {
  auto engine = MakeArticleEngine();
  engine->RegisterGuard("article", "submit_for_review", Deny("Freeze", "frozen"));
  engine->RegisterGuard("article", "submit_for_review", Deny("Other", "other"));

  auto article = engine->CreateEntity("article");
  assert(article->RequestTransition("submit_for_review").guard_name == "Freeze");

  engine->MoveGuard("article", "submit_for_review", "Other", 0);
  assert(article->RequestTransition("submit_for_review").guard_name == "Other");

  engine->RemoveGuard("article", "submit_for_review", "Other");
  engine->RemoveGuard("article", "submit_for_review", "Freeze");
  assert(engine->GuardNames("article", "submit_for_review").empty());
  assert(article->RequestTransition("submit_for_review").committed());
}

void TestHooksSeeCommitsOnly() {
  auto engine = MakeArticleEngine();

  std::vector<TransitionEvent> events;
  auto                         id = engine->AddPostCommitHook([&](const TransitionEvent& event) { events.push_back(event); });

  auto article = engine->CreateEntity("article", "a-7");
  assert(!article->RequestTransition("publish"));
  assert(events.empty());

  assert(article->RequestTransition("submit_for_review").committed());
  assert(events.size() == 1);
  assert(events[0].entity_id == "a-7");
  assert(events[0].entity_kind == "article");
  assert(events[0].action == "submit_for_review");
  assert(events[0].from_state == "draft");
  assert(events[0].to_state == "moderation");
  assert(events[0].version == 1);

  engine->RemovePostCommitHook(id);
  assert(article->RequestTransition("reject").committed());
  assert(events.size() == 1);
}

void TestThrowingHookDoesNotRollBack() {
  auto engine = MakeArticleEngine();

  int later_calls = 0;
  engine->AddPostCommitHook([](const TransitionEvent&) { throw std::runtime_error("mailer down"); });
  engine->AddPostCommitHook([](const TransitionEvent&) { throw 42; });
  engine->AddPostCommitHook([&](const TransitionEvent&) { ++later_calls; });

  auto article = engine->CreateEntity("article");
  auto result  = article->RequestTransition("submit_for_review");

  assert(result.committed());
  assert(result.state == "moderation");
  assert(article->CurrentState() == "moderation");
  assert(later_calls == 1);

  auto retried = article->RequestTransitionWithRetry("reject");
  assert(retried.committed());
  assert(article->CurrentState() == "draft");
  assert(later_calls == 2);
}

void TestConflictAndRetry() {
  auto engine = std::make_shared<LifecycleEngine>();
  engine->RegisterKind("doc", {"draft", "review"}, {"edit", "submit"}, "draft");
  engine->RegisterTransition("doc", "draft", "edit", "draft");
  engine->RegisterTransition("doc", "draft", "submit", "review");

  turnstile::core::Entity* target = nullptr;
  int                      calls  = 0;
  int                      interfere_until = 1;

  // Commits a concurrent edit while the submit is being evaluated.
  engine->RegisterGuard("doc", "submit", std::make_shared<FunctionGuard>("Interfere", [&](const Subject&, const Context&) {
                          if (++calls <= interfere_until) {
                            assert(target->RequestTransition("edit").committed());
                          }
                          return Verdict::Approve();
                        }));

  auto doc = engine->CreateEntity("doc");
  target   = doc.get();

  auto conflict = doc->RequestTransition("submit");
  assert(conflict.status == TransitionStatus::kConcurrencyConflict);
  assert(conflict.state == "draft");
  assert(conflict.version == 1);
  assert(doc->CurrentState() == "draft");

  calls           = 0;
  interfere_until = 1;
  auto retried    = doc->RequestTransitionWithRetry("submit");
  assert(retried.committed());
  assert(retried.state == "review");
  assert(calls == 2);
  assert(doc->Version() == 3);
}

void TestRetryGivesUpAfterMaxAttempts() {
  auto engine = std::make_shared<LifecycleEngine>();
  engine->RegisterKind("doc", {"draft", "review"}, {"edit", "submit"}, "draft");
  engine->RegisterTransition("doc", "draft", "edit", "draft");
  engine->RegisterTransition("doc", "draft", "submit", "review");

  turnstile::core::Entity* target = nullptr;
  int                      calls  = 0;
  engine->RegisterGuard("doc", "submit", std::make_shared<FunctionGuard>("AlwaysInterfere", [&](const Subject&, const Context&) {
                          ++calls;
                          assert(target->RequestTransition("edit").committed());
                          return Verdict::Approve();
                        }));

  auto doc = engine->CreateEntity("doc");
  target   = doc.get();

  auto result = doc->RequestTransitionWithRetry("submit", {}, 2);
  assert(result.status == TransitionStatus::kConcurrencyConflict);
  assert(calls == 2);

  calls = 0;
  result = doc->RequestTransitionWithRetry("submit");
  assert(result.status == TransitionStatus::kConcurrencyConflict);
  assert(calls == static_cast<int>(engine->options().max_conflict_retries));
}

void TestRetryDoesNotRepeatGuardDenial() {
  auto engine = MakeArticleEngine();
  int  calls  = 0;
  engine->RegisterGuard("article", "submit_for_review", Deny("No", "no", &calls));

  auto article = engine->CreateEntity("article");
  auto result  = article->RequestTransitionWithRetry("submit_for_review", {}, 5);
  assert(result.status == TransitionStatus::kGuardDenied);
  assert(calls == 1);
}

void TestAvailableActions() {
  auto engine  = MakeArticleEngine();
  auto article = engine->CreateEntity("article");

  assert((article->AvailableActions() == std::vector<std::string>{"submit_for_review"}));
  assert(article->RequestTransition("submit_for_review").committed());
  assert((article->AvailableActions() == std::vector<std::string>{"publish", "reject"}));

  assert(engine->AllowedTransition("article", "moderation", "publish") == std::string("published"));
  assert(engine->AllowedTransition("article", "moderation", "publish") == std::string("published"));
  assert(engine->Definition("article")->table().size() == 3);
  assert(!engine->AllowedTransition("article", "published", "publish").has_value());
}

void TestCreateEntityErrors() {
  auto engine = MakeArticleEngine();

  bool unknown_kind = false;
  try {
    engine->CreateEntity("invoice");
  } catch (const turnstile::util::NotFound&) {
    unknown_kind = true;
  }
  assert(unknown_kind);

  bool unknown_state = false;
  try {
    engine->CreateEntityInState("article", "archived");
  } catch (const turnstile::util::InvalidState&) {
    unknown_state = true;
  }
  assert(unknown_state);

  auto a = engine->CreateEntity("article");
  auto b = engine->CreateEntity("article");
  assert(a->Id().size() == 36);
  assert(a->Id()[8] == '-' && a->Id()[14] == '4');
  assert(a->Id() != b->Id());

  assert(engine->CreateEntity("article", "given-id")->Id() == "given-id");
}

void TestConfigurationErrors() {
  auto engine = MakeArticleEngine();

  auto throws_config = [](auto&& fn) {
    try {
      fn();
    } catch (const turnstile::util::ConfigurationError&) {
      return true;
    }
    return false;
  };

  assert(throws_config([&] { engine->RegisterKind("article", {"a"}, {"go"}, "a"); }));
  assert(throws_config([&] { engine->RegisterTransition("invoice", "a", "go", "b"); }));
  assert(throws_config([&] { engine->RegisterTransition("article", "draft", "submit_for_review", "published"); }));
  assert(throws_config([&] { engine->RegisterGuard("article", "archive", Deny("X", "x")); }));
  assert(throws_config([&] { engine->RegisterGlobalGuard("invoice", Deny("X", "x")); }));
  assert(throws_config([&] { engine->AddPostCommitHook(nullptr); }));

  bool remove_threw = false;
  try {
    engine->RemoveGuard("article", "publish", "Nobody");
  } catch (const turnstile::util::NotFound&) {
    remove_threw = true;
  }
  assert(remove_threw);

  auto throws_not_found = [](auto&& fn) {
    try {
      fn();
    } catch (const turnstile::util::NotFound&) {
      return true;
    }
    return false;
  };

  assert(throws_not_found([&] { (void)engine->GuardNames("invoice", "pay"); }));
  assert(throws_not_found([&] { (void)engine->GlobalGuardNames("invoice"); }));
  assert(throws_not_found([&] { (void)engine->Definition("invoice"); }));
  assert(throws_not_found([&] { (void)engine->AllowedTransition("invoice", "open", "pay"); }));

  bool hook_threw = false;
  try {
    engine->RemovePostCommitHook(999);
  } catch (const turnstile::util::NotFound&) {
    hook_threw = true;
  }
  assert(hook_threw);
}

void TestEntitiesAreIndependent() {
  auto engine = MakeArticleEngine();
  auto first  = engine->CreateEntity("article");
  auto second = engine->CreateEntity("article");

  assert(first->RequestTransition("submit_for_review").committed());
  assert(first->CurrentState() == "moderation");
  assert(second->CurrentState() == "draft");
  assert(second->Version() == 0);
}

void TestEntityKeepsEngineAlive() {
  EntityPtr article;
  {
    auto engine = MakeArticleEngine();
    article     = engine->CreateEntity("article");
  }
  assert(article->RequestTransition("submit_for_review").committed());
}

} // namespace

int main() {
  TestCommitWithEmptyChain();
  TestMissingRuleIsStructurallyIllegal();
  TestStructuralCheckPrecedesGuards();
  TestGuardDenialCarriesNameAndReason();
  TestGlobalChainRunsFirst();
  TestGuardsOnlyApplyToTheirAction();
  TestGuardReconfigurationAtRuntime();
  TestHooksSeeCommitsOnly();
  TestThrowingHookDoesNotRollBack();
  TestConflictAndRetry();
  TestRetryGivesUpAfterMaxAttempts();
  TestRetryDoesNotRepeatGuardDenial();
  TestAvailableActions();
  TestCreateEntityErrors();
  TestConfigurationErrors();
  TestEntitiesAreIndependent();
  TestEntityKeepsEngineAlive();

  std::cout << "turnstile_unit_lifecycle_engine: pass\n";
  return 0;
}
