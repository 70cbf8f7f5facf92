#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "internal/guard/guard.hpp"

namespace turnstile::guard {

class GuardPosition {
 public:
  static GuardPosition Append() {
    return GuardPosition(true, 0);
  }

  static GuardPosition At(std::size_t index) {
    return GuardPosition(false, index);
  }

  bool IsAppend() const {
    return append_;
  }

  std::size_t index() const {
    return index_;
  }

 private:
  GuardPosition(bool append, std::size_t index) : append_(append), index_(index) {
  }

  bool        append_;
  std::size_t index_;
};

/*
  Ordered, short-circuiting sequence of guards.

  Storage is copy-on-write: every mutation publishes a new immutable vector
  and Evaluate() iterates the snapshot it grabbed first, so reconfiguring a
  chain never disturbs an evaluation already in flight.
*/
class GuardChain {
 public:
  using Snapshot = std::shared_ptr<const std::vector<GuardPtr>>;

  GuardChain();

  // ConfigurationError on null guard, duplicate name or index past the end.
  void Add(GuardPtr guard, GuardPosition position = GuardPosition::Append());

  // NotFound when no guard has that name.
  void Remove(std::string_view name);

  // Moves a guard so that it ends up at `index`.
  void Move(std::string_view name, std::size_t index);

  std::vector<std::string> Names() const;
  std::size_t              size() const;
  bool                     empty() const;

  Snapshot Current() const;

  // First denial wins; an empty chain approves.
  Verdict Evaluate(const Subject& subject, const Context& context) const;

  static Verdict Evaluate(const std::vector<GuardPtr>& guards, const Subject& subject, const Context& context);

 private:
  mutable std::mutex mutex_;
  Snapshot           guards_;
};

using GuardChainPtr = std::shared_ptr<GuardChain>;

} // namespace turnstile::guard
