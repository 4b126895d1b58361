/**
 * @file signature.hpp
 * @brief HMAC-SHA256 webhook signature verification.
 *
 * Declares the verification outcome type and the pure helpers used to sign
 * and verify `X-Hub-Signature-256` style webhook signatures.
 */

#ifndef AUTOWEBHOOKDEPLOY_SIGNATURE_HPP
#define AUTOWEBHOOKDEPLOY_SIGNATURE_HPP

#include <optional>
#include <string>
#include <string_view>

namespace awd {

/// Prefix carried by every signature header value.
inline constexpr std::string_view kSignaturePrefix = "sha256=";

/**
 * Result of checking a declared signature against the shared secret.
 *
 * Each failure mode maps to a different response.
 */
enum class VerificationOutcome {
  Unconfigured, ///< No shared secret is configured
  Malformed,    ///< Signature missing or without the `sha256=` prefix
  Mismatch,     ///< Signature does not authenticate the payload
  Verified      ///< Signature authenticates the payload
};

/// Stable lowercase name of a verification outcome, for logging.
const char *to_string(VerificationOutcome outcome) noexcept;

/**
 * Verify a declared webhook signature.
 *
 * The function has no side effects: it performs no I/O and does not log.
 *
 * @param secret Shared secret, or `std::nullopt` when none is configured.
 * @param declared_signature Raw signature header value, if present.
 * @param raw_body Exact request body bytes the signature was computed over.
 * @return Outcome of the verification.
 * @throws std::runtime_error When OpenSSL fails to compute the digest.
 */
VerificationOutcome
verify_signature(const std::optional<std::string> &secret,
                 const std::optional<std::string> &declared_signature,
                 std::string_view raw_body);

/**
 * Compute the signature header value for a payload.
 *
 * @param secret Shared secret used as the HMAC key.
 * @param body Payload bytes.
 * @return `sha256=` followed by the lowercase hex HMAC-SHA256 digest.
 * @throws std::runtime_error When OpenSSL fails to compute the digest.
 */
std::string compute_signature(std::string_view secret, std::string_view body);

/// Lowercase hex encoding of @p data.
std::string hex_encode(std::string_view data);

/**
 * Decode a hex string (either case).
 *
 * @return Decoded bytes, or `std::nullopt` for odd lengths or non-hex digits.
 */
std::optional<std::string> hex_decode(std::string_view hex);

} // namespace awd

#endif // AUTOWEBHOOKDEPLOY_SIGNATURE_HPP
