#include <cassert>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>

#include "internal/intake/signature_verifier.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/fixtures.hpp"

namespace {

using settlement::intake::SignatureVerifier;
using settlement::testing::ManualClock;

constexpr const char* kSecret = "whsec_test";
const std::string     kBody   = R"({"event_id":"evt_1","event_type":"payment.succeeded","payload":{"order_id":"o1","payment_ref":"pay_1"}})";

int64_t NowSeconds(const ManualClock& clock) {
  return clock.NowMs() / 1000;
}

bool Rejected(const SignatureVerifier& verifier, const std::string& body, const std::string& header) {
  try {
    verifier.Verify(body, header);
  } catch (const settlement::util::Unauthenticated&) {
    return true;
  }
  return false;
}

void TestValidSignatureAccepted() {
  ManualClock       clock;
  SignatureVerifier verifier(kSecret, std::chrono::seconds(300), clock.Fn());

  verifier.Verify(kBody, SignatureVerifier::Sign(kSecret, kBody, NowSeconds(clock)));
}

void TestKnownVector() {
  // HMAC-SHA256("key", "0.The quick brown fox jumps over the lazy dog")
  const auto header = SignatureVerifier::Sign("key", "The quick brown fox jumps over the lazy dog", 0);
  assert(header == "t=0,v1=8511f28f7a1949f0c42772b447d68b2daf760f5f0439a20a17e3b4e7cd395763");
}

void TestTamperedBodyRejected() {
  ManualClock       clock;
  SignatureVerifier verifier(kSecret, std::chrono::seconds(300), clock.Fn());

  const auto header = SignatureVerifier::Sign(kSecret, kBody, NowSeconds(clock));
  assert(Rejected(verifier, kBody + " ", header));
}

void TestWrongSecretRejected() {
  ManualClock       clock;
  SignatureVerifier verifier(kSecret, std::chrono::seconds(300), clock.Fn());

  assert(Rejected(verifier, kBody, SignatureVerifier::Sign("other", kBody, NowSeconds(clock))));
}

void TestStaleAndFutureTimestampsRejected() {
  ManualClock       clock;
  SignatureVerifier verifier(kSecret, std::chrono::seconds(300), clock.Fn());

  const int64_t now = NowSeconds(clock);
  assert(Rejected(verifier, kBody, SignatureVerifier::Sign(kSecret, kBody, now - 301)));
  assert(Rejected(verifier, kBody, SignatureVerifier::Sign(kSecret, kBody, now + 301)));
  verifier.Verify(kBody, SignatureVerifier::Sign(kSecret, kBody, now - 300));
}

void TestMalformedHeadersRejected() {
  ManualClock       clock;
  SignatureVerifier verifier(kSecret, std::chrono::seconds(300), clock.Fn());

  const std::string t = std::to_string(NowSeconds(clock));
  assert(Rejected(verifier, kBody, ""));
  assert(Rejected(verifier, kBody, "garbage"));
  assert(Rejected(verifier, kBody, "t=" + t));
  assert(Rejected(verifier, kBody, "v1=abcdef"));
  assert(Rejected(verifier, kBody, "t=12x,v1=abcdef"));

  // correctly signed, but the timestamp sits at the ends of the int64 range
  const int64_t lowest  = std::numeric_limits<int64_t>::min();
  const int64_t highest = std::numeric_limits<int64_t>::max();
  assert(Rejected(verifier, kBody, SignatureVerifier::Sign(kSecret, kBody, lowest)));
  assert(Rejected(verifier, kBody, SignatureVerifier::Sign(kSecret, kBody, highest)));
  assert(Rejected(verifier, kBody, "t=-9223372036854775808,v1=" + std::string(64, '0')));
  assert(Rejected(verifier, kBody, "t=99999999999999999999,v1=" + std::string(64, '0')));
}

void TestAnyMatchingSignatureAccepted() {
  ManualClock       clock;
  SignatureVerifier verifier(kSecret, std::chrono::seconds(300), clock.Fn());

  const int64_t now           = NowSeconds(clock);
  const auto    signed_header = SignatureVerifier::Sign(kSecret, kBody, now);
  const auto    good          = signed_header.substr(signed_header.find("v1=") + 3);
  const auto    header        = "t=" + std::to_string(now) + ",v1=" + std::string(64, '0') + ", v1=" + good;

  verifier.Verify(kBody, header);
}

void TestEmptySecretRefused() {
  bool threw = false;
  try {
    SignatureVerifier verifier("");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestValidSignatureAccepted();
  TestKnownVector();
  TestTamperedBodyRejected();
  TestWrongSecretRejected();
  TestStaleAndFutureTimestampsRejected();
  TestMalformedHeadersRejected();
  TestAnyMatchingSignatureAccepted();
  TestEmptySecretRefused();

  std::cout << "settlement_unit_signature_verifier: pass\n";
  return 0;
}
