#include "money.hpp"

#include <limits>

#include "errors.hpp"

namespace settlement::util {

namespace {

[[noreturn]] void Reject(std::string_view text) {
  throw ValidationError("invalid_amount", "invalid amount: '" + std::string(text) + "'");
}

} // namespace

int64_t ParseMinor(std::string_view text) {
  if (text.empty()) Reject(text);

  std::size_t pos      = 0;
  bool        negative = false;
  if (text[0] == '-' || text[0] == '+') {
    negative = text[0] == '-';
    pos      = 1;
  }

  constexpr int64_t kMax = std::numeric_limits<int64_t>::max() / 100;

  int64_t whole     = 0;
  bool    saw_digit = false;
  for (; pos < text.size() && text[pos] != '.'; ++pos) {
    const char c = text[pos];
    if (c < '0' || c > '9') Reject(text);
    if (whole > (kMax - (c - '0')) / 10) Reject(text);
    whole     = whole * 10 + (c - '0');
    saw_digit = true;
  }

  int64_t fraction = 0;
  int     digits   = 0;
  if (pos < text.size()) {
    ++pos; // '.'
    for (; pos < text.size(); ++pos) {
      const char c = text[pos];
      if (c < '0' || c > '9' || digits == 2) Reject(text);
      fraction = fraction * 10 + (c - '0');
      ++digits;
      saw_digit = true;
    }
  }
  if (!saw_digit) Reject(text);

  for (; digits < 2; ++digits) fraction *= 10;

  const int64_t minor = whole * 100 + fraction;
  return negative ? -minor : minor;
}

std::string FormatMinor(int64_t minor) {
  const bool     negative = minor < 0;
  const uint64_t abs      = negative ? static_cast<uint64_t>(-(minor + 1)) + 1 : static_cast<uint64_t>(minor);

  std::string cents = std::to_string(abs % 100);
  if (cents.size() < 2) cents.insert(0, "0");

  return (negative ? "-" : "") + std::to_string(abs / 100) + "." + cents;
}

} // namespace settlement::util
