/**
 * @file webhook_handler.hpp
 * @brief Request/response contract of the deploy webhook endpoint.
 *
 * Composes signature verification, event classification and the deployer
 * into the `POST /hooks/deploy` handler.
 */

#ifndef AUTOWEBHOOKDEPLOY_WEBHOOK_HANDLER_HPP
#define AUTOWEBHOOKDEPLOY_WEBHOOK_HANDLER_HPP

#include "deploy.hpp"
#include "http_server.hpp"

#include <optional>
#include <string>

namespace awd {

/// Header carrying `sha256=<hex hmac>` over the raw body.
inline constexpr const char *kSignatureHeader = "X-Hub-Signature-256";
/// Header carrying the event type of the delivery.
inline constexpr const char *kEventHeader = "X-GitHub-Event";
/// Path the handler is mounted on.
inline constexpr const char *kDeployHookPath = "/hooks/deploy";

/** \brief One webhook delivery as seen by the handler. */
struct WebhookRequest {
  std::string body;                     ///< Raw body bytes, never re-encoded
  std::optional<std::string> signature; ///< Declared signature header value
  std::optional<std::string> event;     ///< Declared event type header value

  /// Capture the parts of an HTTP request the handler needs.
  static WebhookRequest from_http(const HttpRequest &request);
};

/** \brief Startup configuration consumed by the handler. */
struct WebhookSettings {
  std::optional<std::string> secret; ///< Shared secret; absent disables hooks
};

/**
 * Handler for deploy webhook deliveries.
 *
 * | condition                  | status | body                              |
 * |----------------------------|--------|-----------------------------------|
 * | secret not configured      | 503    | `{"error":"webhook_unconfigured"}`|
 * | bad or missing signature   | 401    | `{"error":"invalid_signature"}`   |
 * | verified, not `push`       | 202    | `{"status":"ignored",...}`        |
 * | verified `push`            | 202    | `{"status":"accepted"}`           |
 * | anything throws            | 500    | `{"error":"internal_error"}`      |
 *
 * For `push` the deploy is not started inside handle(); the returned
 * response carries it as its post-response action so the client has its
 * answer before the deploy begins.
 */
class WebhookHandler {
public:
  WebhookHandler(WebhookSettings settings, Deployer &deployer);

  /// Process one delivery. Never throws.
  HttpResponse handle(const WebhookRequest &request) const;

  /// Convenience overload used as an HttpServer route.
  HttpResponse operator()(const HttpRequest &request) const;

  /// Whether a shared secret is configured.
  bool configured() const { return settings_.secret.has_value(); }

private:
  HttpResponse process(const WebhookRequest &request) const;

  WebhookSettings settings_;
  Deployer &deployer_;
};

} // namespace awd

#endif // AUTOWEBHOOKDEPLOY_WEBHOOK_HANDLER_HPP
