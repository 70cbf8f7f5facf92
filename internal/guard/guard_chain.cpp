#include "internal/guard/guard_chain.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace turnstile::guard {

namespace {

std::vector<GuardPtr>::const_iterator FindByName(const std::vector<GuardPtr>& guards, std::string_view name) {
  return std::find_if(guards.begin(), guards.end(), [&](const GuardPtr& g) { return g->Name() == name; });
}

} // namespace

GuardChain::GuardChain() : guards_(std::make_shared<const std::vector<GuardPtr>>()) {
}

void GuardChain::Add(GuardPtr guard, GuardPosition position) {
  if (!guard) {
    throw turnstile::util::ConfigurationError("guard chain: cannot add a null guard");
  }

  std::lock_guard lock(mutex_);
  if (FindByName(*guards_, guard->Name()) != guards_->end()) {
    throw turnstile::util::ConfigurationError("guard chain: duplicate guard name '" + guard->Name() + "'");
  }
  if (!position.IsAppend() && position.index() > guards_->size()) {
    throw turnstile::util::ConfigurationError("guard chain: position " + std::to_string(position.index()) + " is past the end of a chain of " +
                                              std::to_string(guards_->size()));
  }

  auto next = std::make_shared<std::vector<GuardPtr>>(*guards_);
  if (position.IsAppend()) {
    next->push_back(std::move(guard));
  } else {
    next->insert(next->begin() + static_cast<std::ptrdiff_t>(position.index()), std::move(guard));
  }
  guards_ = std::move(next);
}

void GuardChain::Remove(std::string_view name) {
  std::lock_guard lock(mutex_);
  auto            it = FindByName(*guards_, name);
  if (it == guards_->end()) {
    throw turnstile::util::NotFound("guard chain: no guard named '" + std::string(name) + "'");
  }

  auto next = std::make_shared<std::vector<GuardPtr>>(*guards_);
  next->erase(next->begin() + (it - guards_->begin()));
  guards_ = std::move(next);
}

void GuardChain::Move(std::string_view name, std::size_t index) {
  std::lock_guard lock(mutex_);
  auto            it = FindByName(*guards_, name);
  if (it == guards_->end()) {
    throw turnstile::util::NotFound("guard chain: no guard named '" + std::string(name) + "'");
  }
  if (index >= guards_->size()) {
    throw turnstile::util::ConfigurationError("guard chain: move target " + std::to_string(index) + " is out of range");
  }

  auto next  = std::make_shared<std::vector<GuardPtr>>(*guards_);
  auto guard = *it;
  next->erase(next->begin() + (it - guards_->begin()));
  next->insert(next->begin() + static_cast<std::ptrdiff_t>(index), std::move(guard));
  guards_ = std::move(next);
}

std::vector<std::string> GuardChain::Names() const {
  auto                     snapshot = Current();
  std::vector<std::string> names;
  names.reserve(snapshot->size());
  for (const auto& guard : *snapshot) {
    names.push_back(guard->Name());
  }
  return names;
}

std::size_t GuardChain::size() const {
  return Current()->size();
}

bool GuardChain::empty() const {
  return Current()->empty();
}

GuardChain::Snapshot GuardChain::Current() const {
  std::lock_guard lock(mutex_);
  return guards_;
}

Verdict GuardChain::Evaluate(const Subject& subject, const Context& context) const {
  auto snapshot = Current();
  return Evaluate(*snapshot, subject, context);
}

Verdict GuardChain::Evaluate(const std::vector<GuardPtr>& guards, const Subject& subject, const Context& context) {
  for (const auto& guard : guards) {
    auto verdict = guard->Evaluate(subject, context);
    if (!verdict) {
      verdict.guard_name = guard->Name();
      return verdict;
    }
  }
  return Verdict::Approve();
}

} // namespace turnstile::guard
