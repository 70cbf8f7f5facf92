#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace turnstile::util {

using UUID = std::array<uint8_t, 16>;

// Random RFC4122 version 4.
UUID GenerateUUID();

// Canonical 8-4-4-4-12 lowercase form.
std::string ToString(const UUID& id);

// Default id for entities created without one.
std::string NewEntityId();

} // namespace turnstile::util
