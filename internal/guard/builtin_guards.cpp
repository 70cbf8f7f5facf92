#include "internal/guard/builtin_guards.hpp"

#include <cctype>

#include "internal/db/api/repository.hpp"

namespace turnstile::guard {

namespace {

std::string OrDefault(std::string reason, std::string fallback) {
  return reason.empty() ? std::move(fallback) : std::move(reason);
}

} // namespace

// ------------------------------------------------------------
// RequiredFieldGuard
// ------------------------------------------------------------

RequiredFieldGuard::RequiredFieldGuard(std::string field, std::string name, std::string reason)
    : Guard(std::move(name)), field_(std::move(field)), reason_(OrDefault(std::move(reason), field_ + " is required")) {
}

Verdict RequiredFieldGuard::Evaluate(const Subject&, const Context& context) const {
  auto value = context.Field(field_);
  if (!value || value->empty()) {
    return Verdict::Deny(reason_);
  }
  return Verdict::Approve();
}

// ------------------------------------------------------------
// LengthGuard
// ------------------------------------------------------------

LengthGuard::LengthGuard(std::string field, std::size_t min_length, std::optional<std::size_t> max_length, std::string name, std::string reason)
    : Guard(std::move(name)), field_(std::move(field)), min_length_(min_length), max_length_(max_length), reason_(std::move(reason)) {
}

Verdict LengthGuard::Evaluate(const Subject&, const Context& context) const {
  const auto length = context.Field(field_).value_or(std::string_view{}).size();

  if (length < min_length_) {
    return Verdict::Deny(OrDefault(reason_, field_ + " must be at least " + std::to_string(min_length_) + " characters"));
  }
  if (max_length_ && length > *max_length_) {
    return Verdict::Deny(OrDefault(reason_, field_ + " must be at most " + std::to_string(*max_length_) + " characters"));
  }
  return Verdict::Approve();
}

// ------------------------------------------------------------
// EmailFormatGuard
// ------------------------------------------------------------

EmailFormatGuard::EmailFormatGuard(std::string field, std::string name, std::string reason)
    : Guard(std::move(name)), field_(std::move(field)), reason_(OrDefault(std::move(reason), "invalid email")) {
}

bool EmailFormatGuard::IsWellFormed(std::string_view email) {
  const auto at = email.find('@');
  if (at == std::string_view::npos || at == 0 || email.find('@', at + 1) != std::string_view::npos) {
    return false;
  }

  for (char c : email) {
    if (std::isspace(static_cast<unsigned char>(c))) return false;
  }

  const auto domain = email.substr(at + 1);
  const auto dot    = domain.find('.');
  return dot != std::string_view::npos && dot != 0 && domain.back() != '.';
}

Verdict EmailFormatGuard::Evaluate(const Subject&, const Context& context) const {
  auto email = context.Field(field_);
  if (!email || !IsWellFormed(*email)) {
    return Verdict::Deny(reason_);
  }
  return Verdict::Approve();
}

// ------------------------------------------------------------
// EmailExistsGuard
// ------------------------------------------------------------

EmailExistsGuard::EmailExistsGuard(std::shared_ptr<turnstile::db::Repository> repository, std::string field, std::string name,
                                   std::string reason)
    : Guard(std::move(name)), repository_(std::move(repository)), field_(std::move(field)), reason_(OrDefault(std::move(reason), "email exists")) {
}

Verdict EmailExistsGuard::Evaluate(const Subject&, const Context& context) const {
  auto email = context.Field(field_);
  if (!email) {
    return Verdict::Approve();
  }

  // read-only snapshot; rolled back on scope exit
  auto tx = repository_->Begin();
  if (repository_->GetAccountByEmail(*tx, std::string(*email)).has_value()) {
    return Verdict::Deny(reason_);
  }
  return Verdict::Approve();
}

// ------------------------------------------------------------
// ReferralGuard
// ------------------------------------------------------------

ReferralGuard::ReferralGuard(std::shared_ptr<turnstile::db::Repository> repository, std::string field, bool optional, std::string name,
                             std::string reason)
    : Guard(std::move(name)), repository_(std::move(repository)), field_(std::move(field)), optional_(optional), reason_(std::move(reason)) {
}

Verdict ReferralGuard::Evaluate(const Subject&, const Context& context) const {
  auto code = context.Field(field_);
  if (!code || code->empty()) {
    if (optional_) return Verdict::Approve();
    return Verdict::Deny(OrDefault(reason_, "referral code required"));
  }

  auto tx     = repository_->Begin();
  auto record = repository_->GetReferralCode(*tx, std::string(*code));
  if (!record.has_value()) {
    return Verdict::Deny(OrDefault(reason_, "referral code not found"));
  }
  if (!record->IsUsable()) {
    return Verdict::Deny(OrDefault(reason_, "referral code exhausted"));
  }
  return Verdict::Approve();
}

// ------------------------------------------------------------
// AuthGuard / RoleGuard
// ------------------------------------------------------------

AuthGuard::AuthGuard(std::string name, std::string reason) : Guard(std::move(name)), reason_(OrDefault(std::move(reason), "authentication required")) {
}

Verdict AuthGuard::Evaluate(const Subject&, const Context& context) const {
  const auto& actor = context.actor();
  if (!actor || actor->id.empty()) {
    return Verdict::Deny(reason_);
  }
  return Verdict::Approve();
}

RoleGuard::RoleGuard(std::string role, std::string name, std::string reason)
    : Guard(std::move(name)), role_(std::move(role)), reason_(OrDefault(std::move(reason), "role " + role_ + " required")) {
}

Verdict RoleGuard::Evaluate(const Subject&, const Context& context) const {
  const auto& actor = context.actor();
  if (!actor || !actor->HasRole(role_)) {
    return Verdict::Deny(reason_);
  }
  return Verdict::Approve();
}

} // namespace turnstile::guard
