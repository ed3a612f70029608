#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace settlement::util {

/*
  UUID helpers

  Ledger entries, failed events and retry records are keyed by the
  canonical 36 character RFC4122 v4 string.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// GenerateUUID() rendered with ToString().
std::string NewId();

} // namespace settlement::util
