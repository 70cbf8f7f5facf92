#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "internal/guard/guard.hpp"

namespace turnstile::db {
class Repository;
}

namespace turnstile::guard {

/*
  Built-in guards for registration-style requests.

  Every guard takes an optional `reason` override; an empty string keeps the
  default text. Reasons are opaque data for the host to localise.
*/

class RequiredFieldGuard final : public Guard {
 public:
  explicit RequiredFieldGuard(std::string field, std::string name = "RequiredFieldGuard", std::string reason = {});

  Verdict Evaluate(const Subject& subject, const Context& context) const override;

 private:
  std::string field_;
  std::string reason_;
};

// Missing fields count as length 0.
class LengthGuard final : public Guard {
 public:
  LengthGuard(std::string field, std::size_t min_length, std::optional<std::size_t> max_length = std::nullopt,
              std::string name = "LengthGuard", std::string reason = {});

  Verdict Evaluate(const Subject& subject, const Context& context) const override;

 private:
  std::string                field_;
  std::size_t                min_length_;
  std::optional<std::size_t> max_length_;
  std::string                reason_;
};

class EmailFormatGuard final : public Guard {
 public:
  explicit EmailFormatGuard(std::string field = "email", std::string name = "EmailFormatGuard", std::string reason = {});

  Verdict Evaluate(const Subject& subject, const Context& context) const override;

  static bool IsWellFormed(std::string_view email);

 private:
  std::string field_;
  std::string reason_;
};

// Denies when an account with the same email is already registered.
class EmailExistsGuard final : public Guard {
 public:
  EmailExistsGuard(std::shared_ptr<turnstile::db::Repository> repository, std::string field = "email",
                   std::string name = "EmailExistsGuard", std::string reason = {});

  Verdict Evaluate(const Subject& subject, const Context& context) const override;

 private:
  std::shared_ptr<turnstile::db::Repository> repository_;
  std::string                                field_;
  std::string                                reason_;
};

// Denies unknown or used-up referral codes. An absent field passes when optional.
class ReferralGuard final : public Guard {
 public:
  ReferralGuard(std::shared_ptr<turnstile::db::Repository> repository, std::string field = "referral_code", bool optional = true,
                std::string name = "ReferralGuard", std::string reason = {});

  Verdict Evaluate(const Subject& subject, const Context& context) const override;

 private:
  std::shared_ptr<turnstile::db::Repository> repository_;
  std::string                                field_;
  bool                                       optional_;
  std::string                                reason_;
};

class AuthGuard final : public Guard {
 public:
  explicit AuthGuard(std::string name = "AuthGuard", std::string reason = {});

  Verdict Evaluate(const Subject& subject, const Context& context) const override;

 private:
  std::string reason_;
};

// Reads Context::actor(), so it belongs after AuthGuard in a chain.
class RoleGuard final : public Guard {
 public:
  explicit RoleGuard(std::string role, std::string name = "RoleGuard", std::string reason = {});

  Verdict Evaluate(const Subject& subject, const Context& context) const override;

 private:
  std::string role_;
  std::string reason_;
};

} // namespace turnstile::guard
