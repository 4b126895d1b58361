#include "webhook_handler.hpp"
#include "event.hpp"
#include "log.hpp"
#include "signature.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <exception>
#include <utility>

namespace awd {

namespace {
std::shared_ptr<spdlog::logger> webhook_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("webhook");
  }();
  return logger;
}

std::shared_ptr<spdlog::logger> security_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("security");
  }();
  return logger;
}

HttpResponse internal_error() {
  return make_json_response(500, nlohmann::json{{"error", "internal_error"}});
}
} // namespace

WebhookRequest WebhookRequest::from_http(const HttpRequest &request) {
  WebhookRequest out;
  out.body = request.body;
  out.signature = request.header(kSignatureHeader);
  out.event = request.header(kEventHeader);
  return out;
}

WebhookHandler::WebhookHandler(WebhookSettings settings, Deployer &deployer)
    : settings_(std::move(settings)), deployer_(deployer) {}

HttpResponse WebhookHandler::operator()(const HttpRequest &request) const {
  return handle(WebhookRequest::from_http(request));
}

HttpResponse WebhookHandler::handle(const WebhookRequest &request) const {
  try {
    return process(request);
  } catch (const std::exception &e) {
    webhook_log()->error("Webhook processing failed: {}", e.what());
  } catch (...) {
    webhook_log()->error("Webhook processing failed with unknown error");
  }
  return internal_error();
}

HttpResponse WebhookHandler::process(const WebhookRequest &request) const {
  const VerificationOutcome outcome =
      verify_signature(settings_.secret, request.signature, request.body);
  switch (outcome) {
  case VerificationOutcome::Unconfigured:
    webhook_log()->info("Webhook secret not configured; delivery refused");
    return make_json_response(
        503, nlohmann::json{{"error", "webhook_unconfigured"}});
  case VerificationOutcome::Malformed:
  case VerificationOutcome::Mismatch:
    security_log()->warn("Rejected webhook delivery: signature {} "
                         "(event header {}, {} body bytes)",
                         to_string(outcome),
                         request.event ? "present" : "absent",
                         request.body.size());
    return make_json_response(401,
                              nlohmann::json{{"error", "invalid_signature"}});
  case VerificationOutcome::Verified:
    break;
  }

  if (classify_event(request.event) == EventAction::Ignore) {
    const std::string event = request.event ? *request.event : "undefined";
    auto response = make_json_response(
        202, nlohmann::json{{"status", "ignored"}, {"detail", "event " + event}});
    webhook_log()->info("Ignoring verified delivery for event '{}'", event);
    return response;
  }

  auto response =
      make_json_response(202, nlohmann::json{{"status", "accepted"}});
  const std::string event = *request.event;
  Deployer &deployer = deployer_;
  response.after_response = [&deployer, event] { deployer.invoke(event); };
  webhook_log()->info("Accepted '{}' delivery; deploy of {} scheduled", event,
                      deployer_.target());
  return response;
}

} // namespace awd
