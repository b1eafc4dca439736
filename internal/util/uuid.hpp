#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace rowsweep::util {

/*
  UUID helpers

  Tokens use raw 16 byte RFC4122 version 4 UUIDs (122 random bits),
  stored in canonical 8-4-4-4-12 text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

bool IsCanonicalUUID(const std::string& str);

} // namespace rowsweep::util
