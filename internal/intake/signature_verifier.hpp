#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include "internal/util/time.hpp"

namespace settlement::intake {

/*
  Processor webhook signatures.

  Header: "t=<unix seconds>,v1=<hex>[,v1=<hex>...]" where each v1 is
  HMAC-SHA256(secret, "<t>.<body>"). Any matching v1 passes, which
  lets the processor rotate secrets.
*/
class SignatureVerifier {
 public:
  SignatureVerifier(std::string secret, std::chrono::seconds tolerance = std::chrono::seconds(300), util::NowFn now = util::Now);

  // Throws util::Unauthenticated on a malformed header, a stale or
  // future timestamp, or no matching signature.
  void Verify(std::string_view body, std::string_view header) const;

  // Header for body signed at timestamp_s.
  static std::string Sign(std::string_view secret, std::string_view body, int64_t timestamp_s);

 private:
  std::string          secret_;
  std::chrono::seconds tolerance_;
  util::NowFn          now_;
};

} // namespace settlement::intake
