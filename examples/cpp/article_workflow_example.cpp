#include <iostream>
#include <memory>

#include "internal/core/lifecycle_engine.hpp"
#include "internal/guard/builtin_guards.hpp"

/*
  Article moderation workflow wired in code.

    draft --submit_for_review--> moderation --publish--> published
                                  moderation --reject--> draft
*/

using turnstile::core::LifecycleEngine;
using turnstile::guard::Actor;
using turnstile::guard::AuthGuard;
using turnstile::guard::Context;
using turnstile::guard::RoleGuard;

static void Print(const char* label, const turnstile::core::TransitionResult& result) {
  std::cout << label << ": " << turnstile::core::ToString(result.status) << " state=" << result.state;
  if (!result.reason.empty()) std::cout << " reason=\"" << result.reason << "\"";
  if (!result.guard_name.empty()) std::cout << " guard=" << result.guard_name;
  std::cout << "\n";
}

int main() {
  auto engine = std::make_shared<LifecycleEngine>();

  engine->RegisterKind("article", {"draft", "moderation", "published"}, {"submit_for_review", "publish", "reject"}, "draft");
  engine->RegisterTransition("article", "draft", "submit_for_review", "moderation");
  engine->RegisterTransition("article", "moderation", "publish", "published");
  engine->RegisterTransition("article", "moderation", "reject", "draft");

  engine->RegisterGlobalGuard("article", std::make_shared<AuthGuard>());
  engine->RegisterGuard("article", "publish", std::make_shared<RoleGuard>("moderator"));

  engine->AddPostCommitHook([](const turnstile::core::TransitionEvent& event) {
    std::cout << "  [hook] " << event.entity_id << " " << event.from_state << " -> " << event.to_state << "\n";
  });

  auto article = engine->CreateEntity("article", "article-42");

  Context author;
  author.SetActor(Actor{"alice", {"author"}});

  Context moderator;
  moderator.SetActor(Actor{"bob", {"moderator"}});

  Print("publish from draft", article->RequestTransition("publish", moderator));
  Print("submit without login", article->RequestTransition("submit_for_review"));
  Print("submit", article->RequestTransition("submit_for_review", author));
  Print("publish as author", article->RequestTransition("publish", author));
  Print("publish as moderator", article->RequestTransition("publish", moderator));
  Print("publish again", article->RequestTransition("publish", moderator));

  return article->CurrentState() == "published" ? 0 : 1;
}
