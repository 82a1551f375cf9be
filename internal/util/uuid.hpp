#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace narrative::util {

/*
  UUID helpers

  Narrative, audit entry, cluster group and session ids are random
  RFC4122 v4 UUIDs in canonical text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// Shorthand for ToString(GenerateUUID()).
std::string NewId();

} // namespace narrative::util
