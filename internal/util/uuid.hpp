#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace fetchgate::util {

/*
  UUID helpers

  Transfer and session identifiers are random RFC4122 v4 UUIDs rendered in
  the canonical 36 character form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

inline std::string NewId() {
  return ToString(GenerateUUID());
}

} // namespace fetchgate::util
