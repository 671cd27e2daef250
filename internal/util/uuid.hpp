#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace weave::util {

/*
  UUID helpers

  Run ids, task ids and lease tokens are RFC4122 v4 UUIDs in string form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// Shorthand for ToString(GenerateUUID()).
std::string NewId();

} // namespace weave::util
