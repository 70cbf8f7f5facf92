#pragma once

#include <chrono>
#include <cstdint>

namespace turnstile::util {

// Commit timestamps and seed record times.

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);

} // namespace turnstile::util
