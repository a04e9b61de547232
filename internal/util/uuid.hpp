#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace fetchledger::util {

/*
  Random identifiers.

  Generated session ids carry a short random tag so that two sessions for the
  same target created within one clock tick still get distinct ids.
*/

using UUID = std::array<std::uint8_t, 16>;

// RFC4122 version 4.
UUID GenerateUUID();

// 8-4-4-4-12 lowercase hex.
std::string ToString(const UUID& id);

// First `length` hex digits of a fresh UUID (at most 32).
std::string RandomTag(std::size_t length = 8);

} // namespace fetchledger::util
