#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace relay::util {

/*
  UUID helpers

  Connection and chunk ids are RFC4122 v4 UUIDs rendered as text.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

std::string NewId();

// Lowercase hex of `bytes` random bytes, used for event ids.
std::string RandomHex(std::size_t bytes);

} // namespace relay::util
