#include "signature.hpp"
#include "webhook_handler.hpp"

#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include <future>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

class FakeDeployer : public awd::Deployer {
public:
  std::vector<std::string> events;
  bool fail_target{false};

  awd::DeployHandle invoke(const std::string &event_type) override {
    events.push_back(event_type);
    std::promise<awd::DeployInvocation> promise;
    awd::DeployInvocation invocation;
    invocation.id = events.size();
    invocation.event = event_type;
    invocation.status = awd::DeployStatus::Success;
    promise.set_value(invocation);
    return awd::DeployHandle(promise.get_future().share());
  }

  std::string target() const override {
    if (fail_target) {
      throw std::runtime_error("deploy target unavailable");
    }
    return "sh deploy.sh";
  }
};

const std::string kSecret = "s3cret";
const std::string kBody =
    R"({"ref":"refs/heads/main","repository":{"full_name":"example/repo"}})";

awd::WebhookRequest signed_request(const std::string &event) {
  awd::WebhookRequest request;
  request.body = kBody;
  request.signature = awd::compute_signature(kSecret, kBody);
  request.event = event;
  return request;
}

nlohmann::json body_of(const awd::HttpResponse &response) {
  return nlohmann::json::parse(response.body);
}

} // namespace

TEST_CASE("verified push is accepted and deploys after the response",
          "[webhook]") {
  FakeDeployer deployer;
  awd::WebhookHandler handler(awd::WebhookSettings{kSecret}, deployer);
  auto response = handler.handle(signed_request("push"));
  REQUIRE(response.status == 202);
  REQUIRE(body_of(response) == nlohmann::json{{"status", "accepted"}});
  REQUIRE(deployer.events.empty());
  REQUIRE(response.after_response);
  response.after_response();
  REQUIRE(deployer.events == std::vector<std::string>{"push"});
}

TEST_CASE("verified non-push event is ignored without deploying",
          "[webhook]") {
  FakeDeployer deployer;
  awd::WebhookHandler handler(awd::WebhookSettings{kSecret}, deployer);
  auto response = handler.handle(signed_request("issues"));
  REQUIRE(response.status == 202);
  REQUIRE(body_of(response) ==
          nlohmann::json{{"status", "ignored"}, {"detail", "event issues"}});
  REQUIRE_FALSE(response.after_response);
  REQUIRE(deployer.events.empty());
}

TEST_CASE("verified delivery without event header is ignored", "[webhook]") {
  FakeDeployer deployer;
  awd::WebhookHandler handler(awd::WebhookSettings{kSecret}, deployer);
  auto request = signed_request("push");
  request.event.reset();
  auto response = handler.handle(request);
  REQUIRE(response.status == 202);
  REQUIRE(body_of(response)["detail"] == "event undefined");
  REQUIRE_FALSE(response.after_response);
}

TEST_CASE("bad signatures are rejected before event inspection",
          "[webhook]") {
  FakeDeployer deployer;
  awd::WebhookHandler handler(awd::WebhookSettings{kSecret}, deployer);
  const nlohmann::json rejected{{"error", "invalid_signature"}};

  SECTION("tampered body") {
    auto request = signed_request("push");
    request.body += " ";
    auto response = handler.handle(request);
    REQUIRE(response.status == 401);
    REQUIRE(body_of(response) == rejected);
  }
  SECTION("missing header") {
    auto request = signed_request("push");
    request.signature.reset();
    REQUIRE(handler.handle(request).status == 401);
  }
  SECTION("wrong prefix") {
    auto request = signed_request("ping");
    request.signature = "sha1=" + request.signature->substr(7);
    auto response = handler.handle(request);
    REQUIRE(response.status == 401);
    REQUIRE(body_of(response) == rejected);
  }
  SECTION("signed with another secret") {
    auto request = signed_request("push");
    request.signature = awd::compute_signature("other", kBody);
    REQUIRE(handler.handle(request).status == 401);
  }
  REQUIRE(deployer.events.empty());
}

TEST_CASE("unconfigured secret refuses every delivery", "[webhook]") {
  FakeDeployer deployer;
  awd::WebhookHandler handler(awd::WebhookSettings{}, deployer);
  REQUIRE_FALSE(handler.configured());
  auto response = handler.handle(signed_request("push"));
  REQUIRE(response.status == 503);
  REQUIRE(body_of(response) ==
          nlohmann::json{{"error", "webhook_unconfigured"}});
  REQUIRE_FALSE(response.after_response);
  REQUIRE(deployer.events.empty());
}

TEST_CASE("unexpected failures map to 500", "[webhook]") {
  FakeDeployer deployer;
  deployer.fail_target = true;
  awd::WebhookHandler handler(awd::WebhookSettings{kSecret}, deployer);
  auto response = handler.handle(signed_request("push"));
  REQUIRE(response.status == 500);
  REQUIRE(body_of(response) == nlohmann::json{{"error", "internal_error"}});
  REQUIRE_FALSE(response.after_response);
  REQUIRE(deployer.events.empty());
}

TEST_CASE("event names with invalid UTF-8 are still ignored", "[webhook]") {
  FakeDeployer deployer;
  awd::WebhookHandler handler(awd::WebhookSettings{kSecret}, deployer);
  auto response = handler.handle(signed_request("issu\xff" "es"));
  REQUIRE(response.status == 202);
  REQUIRE(body_of(response)["status"] == "ignored");
  REQUIRE_FALSE(response.after_response);
  REQUIRE(deployer.events.empty());
}

TEST_CASE("from_http reads headers case-insensitively", "[webhook]") {
  awd::HttpRequest http;
  http.method = "POST";
  http.path = awd::kDeployHookPath;
  http.headers["x-hub-signature-256"] = "sha256=00";
  http.headers["x-github-event"] = "push";
  http.body = "{}";
  auto request = awd::WebhookRequest::from_http(http);
  REQUIRE(request.signature == std::string("sha256=00"));
  REQUIRE(request.event == std::string("push"));
  REQUIRE(request.body == "{}");

  awd::HttpRequest bare;
  auto empty = awd::WebhookRequest::from_http(bare);
  REQUIRE_FALSE(empty.signature);
  REQUIRE_FALSE(empty.event);
}
