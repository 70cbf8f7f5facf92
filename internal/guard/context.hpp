#pragma once

#include <algorithm>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace turnstile::guard {

/*
  Authenticated caller identity.

  This is the typed field guards like AuthGuard and RoleGuard read. The host
  populates it while assembling the Context; guards never write it.
*/
struct Actor {
  std::string              id;
  std::vector<std::string> roles;

  bool HasRole(std::string_view role) const {
    return std::find(roles.begin(), roles.end(), role) != roles.end();
  }
};

/*
  Caller payload for one transition request.

  Built by the host before calling in and passed to guards by const
  reference, so a guard can read but never mutate it.
*/
class Context {
 public:
  using Fields = std::map<std::string, std::string, std::less<>>;

  Context() = default;

  Context& Set(std::string key, std::string value) {
    fields_[std::move(key)] = std::move(value);
    return *this;
  }

  Context& SetActor(Actor actor) {
    actor_ = std::move(actor);
    return *this;
  }

  std::optional<std::string_view> Field(std::string_view key) const {
    auto it = fields_.find(key);
    if (it == fields_.end()) return std::nullopt;
    return std::string_view(it->second);
  }

  bool Has(std::string_view key) const {
    return fields_.find(key) != fields_.end();
  }

  const std::optional<Actor>& actor() const {
    return actor_;
  }

  const Fields& fields() const {
    return fields_;
  }

 private:
  Fields               fields_;
  std::optional<Actor> actor_;
};

/*
  Identity of the pending transition, filled in by the engine.

  Views are only valid for the duration of one evaluation.
*/
struct Subject {
  std::string_view entity_id;
  std::string_view entity_kind;
  std::string_view action;
  std::string_view from_state;
  std::string_view to_state;
};

} // namespace turnstile::guard
