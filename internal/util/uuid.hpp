#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace taskengine::util {

/*
  UUID helpers

  Task ids are RFC4122 version 4 UUIDs in canonical text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// Canonical 8-4-4-4-12 lowercase or uppercase hex form.
bool IsCanonicalUUID(const std::string& str);

std::string GenerateUUIDString();

} // namespace taskengine::util
