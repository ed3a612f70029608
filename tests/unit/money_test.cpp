#include <cassert>
#include <iostream>
#include <limits>
#include <string>

#include "internal/util/errors.hpp"
#include "internal/util/money.hpp"

namespace {

using settlement::util::FormatMinor;
using settlement::util::ParseMinor;

bool Invalid(const std::string& text) {
  try {
    ParseMinor(text);
  } catch (const settlement::util::ValidationError& e) {
    return e.reason() == "invalid_amount";
  }
  return false;
}

void TestParse() {
  assert(ParseMinor("100.00") == 10000);
  assert(ParseMinor("100") == 10000);
  assert(ParseMinor("12.5") == 1250);
  assert(ParseMinor("0.01") == 1);
  assert(ParseMinor(".5") == 50);
  assert(ParseMinor("-0.5") == -50);
  assert(ParseMinor("+3") == 300);
}

void TestParseRejects() {
  assert(Invalid(""));
  assert(Invalid("-"));
  assert(Invalid("."));
  assert(Invalid("1.234"));
  assert(Invalid("1,00"));
  assert(Invalid("12a"));
  assert(Invalid("1e3"));
  assert(Invalid("99999999999999999999"));
}

void TestFormat() {
  assert(FormatMinor(0) == "0.00");
  assert(FormatMinor(1) == "0.01");
  assert(FormatMinor(1250) == "12.50");
  assert(FormatMinor(-50) == "-0.50");
  assert(FormatMinor(-10000) == "-100.00");
  assert(FormatMinor(std::numeric_limits<int64_t>::min()) == "-92233720368547758.08");
}

void TestFormatParsesBack() {
  for (int64_t minor : {0LL, 7LL, 99LL, 100LL, 123456LL, -1LL, -987654LL}) {
    assert(ParseMinor(FormatMinor(minor)) == minor);
  }
}

} // namespace

int main() {
  TestParse();
  TestParseRejects();
  TestFormat();
  TestFormatParsesBack();

  std::cout << "settlement_unit_money: pass\n";
  return 0;
}
