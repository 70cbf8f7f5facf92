#include "internal/guard/guard_factory.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <optional>
#include <string>

#include "internal/guard/builtin_guards.hpp"
#include "internal/util/errors.hpp"

namespace turnstile::guard {

namespace {

using turnstile::runtime::config::GuardConfig;
using turnstile::util::ConfigurationError;

void RejectUnknownParams(const GuardConfig& cfg, std::initializer_list<std::string_view> allowed) {
  for (const auto& [key, _] : cfg.params()) {
    bool known = key == "reason";
    for (auto name : allowed) {
      known = known || key == name;
    }
    if (!known) {
      throw ConfigurationError("guard '" + cfg.type() + "': unknown param '" + key + "'");
    }
  }
}

std::optional<std::string> Param(const GuardConfig& cfg, const std::string& key) {
  auto it = cfg.params().find(key);
  if (it == cfg.params().end()) return std::nullopt;
  return it->second;
}

std::string RequiredParam(const GuardConfig& cfg, const std::string& key) {
  auto value = Param(cfg, key);
  if (!value || value->empty()) {
    throw ConfigurationError("guard '" + cfg.type() + "': missing param '" + key + "'");
  }
  return *value;
}

std::size_t ParseSize(const GuardConfig& cfg, const std::string& key, const std::string& text) {
  const bool digits_only = !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); });
  if (!digits_only || text.size() > 9) {
    throw ConfigurationError("guard '" + cfg.type() + "': param '" + key + "' must be a non-negative integer, got '" + text + "'");
  }
  return static_cast<std::size_t>(std::stoul(text));
}

bool ParseBool(const GuardConfig& cfg, const std::string& key, const std::string& text) {
  if (text == "true") return true;
  if (text == "false") return false;
  throw ConfigurationError("guard '" + cfg.type() + "': param '" + key + "' must be true or false, got '" + text + "'");
}

std::string NameOr(const GuardConfig& cfg, const char* fallback) {
  return cfg.name().empty() ? std::string(fallback) : cfg.name();
}

} // namespace

GuardFactory::GuardFactory(std::shared_ptr<turnstile::db::Repository> repository) : repository_(std::move(repository)) {
}

GuardPtr GuardFactory::Build(const GuardConfig& cfg) const {
  const auto& type   = cfg.type();
  const auto  reason = Param(cfg, "reason").value_or("");

  if (type == "required_field") {
    RejectUnknownParams(cfg, {"field"});
    return std::make_shared<RequiredFieldGuard>(RequiredParam(cfg, "field"), NameOr(cfg, "RequiredFieldGuard"), reason);
  }

  if (type == "length") {
    RejectUnknownParams(cfg, {"field", "min", "max"});
    const auto field = RequiredParam(cfg, "field");

    std::size_t min_length = 0;
    if (auto min = Param(cfg, "min")) min_length = ParseSize(cfg, "min", *min);

    std::optional<std::size_t> max_length;
    if (auto max = Param(cfg, "max")) max_length = ParseSize(cfg, "max", *max);

    if (max_length && *max_length < min_length) {
      throw ConfigurationError("guard 'length': max is smaller than min");
    }
    return std::make_shared<LengthGuard>(field, min_length, max_length, NameOr(cfg, "LengthGuard"), reason);
  }

  if (type == "email_format") {
    RejectUnknownParams(cfg, {"field"});
    return std::make_shared<EmailFormatGuard>(Param(cfg, "field").value_or("email"), NameOr(cfg, "EmailFormatGuard"), reason);
  }

  if (type == "email_not_registered") {
    RejectUnknownParams(cfg, {"field"});
    if (!repository_) throw ConfigurationError("guard 'email_not_registered' needs a repository");
    return std::make_shared<EmailExistsGuard>(repository_, Param(cfg, "field").value_or("email"), NameOr(cfg, "EmailExistsGuard"), reason);
  }

  if (type == "referral_code_exists") {
    RejectUnknownParams(cfg, {"field", "optional"});
    if (!repository_) throw ConfigurationError("guard 'referral_code_exists' needs a repository");
    bool optional = true;
    if (auto text = Param(cfg, "optional")) optional = ParseBool(cfg, "optional", *text);
    return std::make_shared<ReferralGuard>(repository_, Param(cfg, "field").value_or("referral_code"), optional, NameOr(cfg, "ReferralGuard"),
                                           reason);
  }

  if (type == "authenticated") {
    RejectUnknownParams(cfg, {});
    return std::make_shared<AuthGuard>(NameOr(cfg, "AuthGuard"), reason);
  }

  if (type == "role") {
    RejectUnknownParams(cfg, {"role"});
    return std::make_shared<RoleGuard>(RequiredParam(cfg, "role"), NameOr(cfg, "RoleGuard"), reason);
  }

  throw ConfigurationError("unknown guard type '" + type + "'");
}

} // namespace turnstile::guard
