/**
 * @file webhook_client.hpp
 * @brief Signed test delivery sender.
 *
 * Posts a signed webhook to a running gateway so operators can check the
 * secret and the deploy wiring end to end.
 */

#ifndef AUTOWEBHOOKDEPLOY_WEBHOOK_CLIENT_HPP
#define AUTOWEBHOOKDEPLOY_WEBHOOK_CLIENT_HPP

#include <string>

namespace awd {

/// Payload sent when none is supplied.
inline constexpr const char *kDefaultTestPayload =
    R"({"ref":"refs/heads/main","repository":{"full_name":"example/repo"}})";

/// User agent announced by the sender.
inline constexpr const char *kClientUserAgent = "autowebhookdeploy";

/** \brief Status and body returned by the gateway for a test delivery. */
struct WebhookReply {
  long status{0};   ///< HTTP status code
  std::string body; ///< Response body
};

/**
 * Send a signed webhook delivery.
 *
 * The body is signed with HMAC-SHA256 under @p secret and posted with the
 * `X-Hub-Signature-256` and `X-GitHub-Event` headers. Error statuses are
 * returned, not thrown, so callers can show the gateway's answer.
 *
 * @param url Full URL of the deploy hook, e.g. `http://127.0.0.1:3040/hooks/deploy`.
 * @param secret Shared secret used for signing.
 * @param event Event type header value.
 * @param payload Raw request body.
 * @param timeout_ms Connect and transfer timeout in milliseconds.
 * @throws std::runtime_error When the request cannot be delivered.
 */
WebhookReply send_test_webhook(const std::string &url,
                               const std::string &secret,
                               const std::string &event = "push",
                               const std::string &payload = kDefaultTestPayload,
                               long timeout_ms = 10000);

} // namespace awd

#endif // AUTOWEBHOOKDEPLOY_WEBHOOK_CLIENT_HPP
