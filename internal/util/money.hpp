#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace settlement::util {

/*
  Amounts are int64 minor units (cents). Decimal strings appear only at
  the edges: CLI arguments and log lines.
*/

// "12.5" -> 1250, "-0.01" -> -1. Throws ValidationError("invalid_amount")
// on malformed input or more than two fractional digits.
int64_t ParseMinor(std::string_view text);

// 1250 -> "12.50"
std::string FormatMinor(int64_t minor);

} // namespace settlement::util
