#include "signature.hpp"

#include <array>
#include <stdexcept>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace awd {

namespace {

using Digest = std::array<unsigned char, EVP_MAX_MD_SIZE>;

unsigned int hmac_sha256(std::string_view secret, std::string_view body,
                         Digest &out) {
  unsigned int len = 0;
  const unsigned char *result =
      HMAC(EVP_sha256(), secret.data(), static_cast<int>(secret.size()),
           reinterpret_cast<const unsigned char *>(body.data()), body.size(),
           out.data(), &len);
  if (result == nullptr) {
    throw std::runtime_error("HMAC-SHA256 computation failed");
  }
  return len;
}

int hex_value(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

} // namespace

const char *to_string(VerificationOutcome outcome) noexcept {
  switch (outcome) {
  case VerificationOutcome::Unconfigured:
    return "unconfigured";
  case VerificationOutcome::Malformed:
    return "malformed";
  case VerificationOutcome::Mismatch:
    return "mismatch";
  case VerificationOutcome::Verified:
    return "verified";
  }
  return "unknown";
}

std::string hex_encode(std::string_view data) {
  static constexpr char digits[] = "0123456789abcdef";
  std::string out;
  out.reserve(data.size() * 2);
  for (unsigned char c : data) {
    out.push_back(digits[c >> 4]);
    out.push_back(digits[c & 0x0f]);
  }
  return out;
}

std::optional<std::string> hex_decode(std::string_view hex) {
  if (hex.size() % 2 != 0) {
    return std::nullopt;
  }
  std::string out;
  out.reserve(hex.size() / 2);
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    int hi = hex_value(hex[i]);
    int lo = hex_value(hex[i + 1]);
    if (hi < 0 || lo < 0) {
      return std::nullopt;
    }
    out.push_back(static_cast<char>((hi << 4) | lo));
  }
  return out;
}

std::string compute_signature(std::string_view secret, std::string_view body) {
  Digest digest{};
  unsigned int len = hmac_sha256(secret, body, digest);
  std::string out(kSignaturePrefix);
  out += hex_encode(
      std::string_view(reinterpret_cast<const char *>(digest.data()), len));
  return out;
}

VerificationOutcome
verify_signature(const std::optional<std::string> &secret,
                 const std::optional<std::string> &declared_signature,
                 std::string_view raw_body) {
  if (!secret) {
    return VerificationOutcome::Unconfigured;
  }
  if (!declared_signature ||
      declared_signature->compare(0, kSignaturePrefix.size(),
                                  kSignaturePrefix) != 0) {
    return VerificationOutcome::Malformed;
  }
  auto provided = hex_decode(
      std::string_view(*declared_signature).substr(kSignaturePrefix.size()));
  if (!provided) {
    return VerificationOutcome::Mismatch;
  }
  Digest expected{};
  unsigned int len = hmac_sha256(*secret, raw_body, expected);
  // Length is public (always the digest size); only contents are compared in
  // constant time.
  if (provided->size() != len) {
    return VerificationOutcome::Mismatch;
  }
  if (CRYPTO_memcmp(provided->data(), expected.data(), len) != 0) {
    return VerificationOutcome::Mismatch;
  }
  return VerificationOutcome::Verified;
}

} // namespace awd
