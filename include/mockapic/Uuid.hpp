#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace mockapic {

/*
  UUID helpers

  Mock identifiers are RFC4122 version 4 UUIDs in the canonical
  8-4-4-4-12 text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID generateUUID();
std::string newUUIDString();

std::string toString(const UUID& id);

// Throws InvalidIdError on the wrong length or a non-hex digit.
UUID parseUUID(const std::string& text);

} // namespace mockapic
