#pragma once

#include <functional>
#include <memory>
#include <string>

#include "internal/guard/context.hpp"

namespace turnstile::guard {

struct Verdict {
  bool        approved = true;
  std::string reason;

  // Set by GuardChain on denial.
  std::string guard_name;

  static Verdict Approve() {
    return {};
  }

  static Verdict Deny(std::string reason) {
    return {false, std::move(reason), {}};
  }

  explicit operator bool() const {
    return approved;
  }
};

/*
  Single-responsibility predicate that may veto a transition.

  Implementations may hold their own configuration but must not mutate
  shared state from Evaluate(), and must only depend on other guards through
  typed Context fields.
*/
class Guard {
 public:
  explicit Guard(std::string name) : name_(std::move(name)) {
  }
  virtual ~Guard() = default;

  const std::string& Name() const {
    return name_;
  }

  virtual Verdict Evaluate(const Subject& subject, const Context& context) const = 0;

 private:
  std::string name_;
};

using GuardPtr = std::shared_ptr<const Guard>;

/*
  Adapts a callable to the Guard interface. Mostly used by hosts and tests.
*/
class FunctionGuard final : public Guard {
 public:
  using Fn = std::function<Verdict(const Subject&, const Context&)>;

  FunctionGuard(std::string name, Fn fn) : Guard(std::move(name)), fn_(std::move(fn)) {
  }

  Verdict Evaluate(const Subject& subject, const Context& context) const override {
    return fn_(subject, context);
  }

 private:
  Fn fn_;
};

} // namespace turnstile::guard
