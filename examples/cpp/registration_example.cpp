#include <iostream>
#include <memory>
#include <string>
#include <unordered_map>

#include "internal/config/config_loader.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/factory.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

/*
  Registration gated by [EmailExistsGuard, PasswordGuard, ReferralGuard],
  configured from YAML. A post-commit hook writes the account, so a second
  registration with the same email is denied.
*/

static const char* kConfig = R"(
repository:
  seed_referral_codes:
    - code: "FRIENDS"
      max_uses: 1
entity_kinds:
  - name: registration
    states: [submitted, registered]
    actions: [register]
    initial_state: submitted
    transitions:
      - {from: submitted, action: register, to: registered}
    chains:
      - action: register
        guards:
          - type: email_not_registered
          - type: length
            name: PasswordGuard
            params: {field: "password", min: "8"}
          - type: referral_code_exists
)";

int main() {
  auto config = turnstile::config::ConfigLoader::LoadFromYamlString(kConfig);
  auto app    = turnstile::factory::Build(config);

  // Persisting accepted registrations is the host's job, not the engine's.
  std::unordered_map<std::string, turnstile::guard::Context> pending;
  app.engine->AddPostCommitHook([&](const turnstile::core::TransitionEvent& event) {
    const auto& context = pending.at(event.entity_id);

    auto tx = app.repository->Begin();
    turnstile::db::model::AccountRecord account;
    account.id            = turnstile::util::NewEntityId();
    account.email         = std::string(context.Field("email").value_or(""));
    account.referral_code = std::string(context.Field("referral_code").value_or(""));
    account.created_at_ms = turnstile::util::ToUnixMillis(turnstile::util::Now());
    turnstile::db::ThrowIfDbError(app.repository->InsertAccount(*tx, account), "insert account");
    if (!account.referral_code.empty()) {
      turnstile::db::ThrowIfDbError(app.repository->RedeemReferralCode(*tx, account.referral_code), "redeem referral code");
    }
    tx->Commit();
  });

  auto attempt = [&](const std::string& email, const std::string& password, const std::string& code) {
    auto request = app.engine->CreateEntity("registration");

    auto& context = pending[request->Id()];
    context.Set("email", email).Set("password", password);
    if (!code.empty()) context.Set("referral_code", code);

    auto result = request->RequestTransition("register", context);
    std::cout << email << ": " << turnstile::core::ToString(result.status);
    if (!result.committed()) std::cout << " (" << result.guard_name << ": " << result.reason << ")";
    std::cout << "\n";
    return result.committed();
  };

  bool ok = attempt("ann@example.com", "correct-horse", "FRIENDS");
  ok      = !attempt("ann@example.com", "battery-staple", "") && ok;
  ok      = !attempt("ben@example.com", "short", "") && ok;
  ok      = !attempt("cat@example.com", "long-enough", "FRIENDS") && ok;
  ok      = attempt("cat@example.com", "long-enough", "") && ok;

  auto tx = app.repository->Begin();
  for (const auto& account : app.repository->ListAccounts(*tx)) {
    std::cout << "account " << account.email << " referral=" << (account.referral_code.empty() ? "-" : account.referral_code) << "\n";
  }

    return ok ? 0 : 1;
}
