#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace outbox::util {

/*
  UUID helpers

  Producers without their own id scheme get a random RFC4122 v4 UUID
  rendered in the canonical 36 character form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// shorthand for ToString(GenerateUUID())
std::string GenerateEventId();

} // namespace outbox::util
