#include "signature_verifier.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <array>
#include <charconv>
#include <stdexcept>
#include <vector>

#include "internal/util/errors.hpp"

namespace settlement::intake {

namespace {

using Digest = std::array<unsigned char, 32>;

Digest ComputeHmac(std::string_view secret, std::string_view timestamp, std::string_view body) {
  std::string signed_payload;
  signed_payload.reserve(timestamp.size() + 1 + body.size());
  signed_payload.append(timestamp).append(".").append(body);

  Digest       digest{};
  unsigned int length = 0;
  const auto*  ok     = HMAC(EVP_sha256(), secret.data(), static_cast<int>(secret.size()), reinterpret_cast<const unsigned char*>(signed_payload.data()),
                             signed_payload.size(), digest.data(), &length);
  if (ok == nullptr || length != digest.size()) {
    throw std::runtime_error("HMAC-SHA256 computation failed");
  }
  return digest;
}

std::string ToHex(const Digest& digest) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out;
  out.reserve(digest.size() * 2);
  for (unsigned char byte : digest) {
    out.push_back(kHex[byte >> 4]);
    out.push_back(kHex[byte & 0x0f]);
  }
  return out;
}

struct ParsedHeader {
  std::string_view              timestamp;
  std::vector<std::string_view> signatures;
};

ParsedHeader ParseHeader(std::string_view header) {
  ParsedHeader parsed;
  while (!header.empty()) {
    const auto comma = header.find(',');
    auto       part  = header.substr(0, comma);
    header           = comma == std::string_view::npos ? std::string_view{} : header.substr(comma + 1);

    while (!part.empty() && part.front() == ' ') part.remove_prefix(1);
    const auto eq = part.find('=');
    if (eq == std::string_view::npos) {
      continue;
    }
    const auto key   = part.substr(0, eq);
    const auto value = part.substr(eq + 1);
    if (key == "t") {
      parsed.timestamp = value;
    } else if (key == "v1") {
      parsed.signatures.push_back(value);
    }
  }
  return parsed;
}

} // namespace

SignatureVerifier::SignatureVerifier(std::string secret, std::chrono::seconds tolerance, util::NowFn now)
    : secret_(std::move(secret)), tolerance_(tolerance), now_(std::move(now)) {
  if (secret_.empty()) {
    throw std::invalid_argument("webhook secret must not be empty");
  }
}

void SignatureVerifier::Verify(std::string_view body, std::string_view header) const {
  const auto parsed = ParseHeader(header);
  if (parsed.timestamp.empty() || parsed.signatures.empty()) {
    throw util::Unauthenticated("signature header missing timestamp or v1 signature");
  }

  int64_t timestamp_s = 0;
  const auto [end, ec] = std::from_chars(parsed.timestamp.data(), parsed.timestamp.data() + parsed.timestamp.size(), timestamp_s);
  if (ec != std::errc() || end != parsed.timestamp.data() + parsed.timestamp.size()) {
    throw util::Unauthenticated("signature timestamp is not a number");
  }

  // The bounds come from the clock only; timestamp_s is untrusted and
  // may sit at either end of the int64 range.
  const int64_t now_s = util::ToUnixMillis(now_()) / 1000;
  const int64_t slack = static_cast<int64_t>(tolerance_.count());
  if (timestamp_s < now_s - slack || timestamp_s > now_s + slack) {
    throw util::Unauthenticated("signature timestamp outside tolerance");
  }

  const auto expected = ToHex(ComputeHmac(secret_, parsed.timestamp, body));
  for (const auto candidate : parsed.signatures) {
    if (candidate.size() == expected.size() && CRYPTO_memcmp(candidate.data(), expected.data(), expected.size()) == 0) {
      return;
    }
  }
  throw util::Unauthenticated("no matching v1 signature");
}

std::string SignatureVerifier::Sign(std::string_view secret, std::string_view body, int64_t timestamp_s) {
  const auto timestamp = std::to_string(timestamp_s);
  return "t=" + timestamp + ",v1=" + ToHex(ComputeHmac(secret, timestamp, body));
}

} // namespace settlement::intake
