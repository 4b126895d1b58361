#include "app.hpp"
#include "deploy.hpp"
#include "http_server.hpp"
#include "log.hpp"
#include "webhook_client.hpp"
#include "webhook_handler.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <thread>

namespace {
std::shared_ptr<spdlog::logger> main_log() {
  static auto logger = [] {
    awd::ensure_default_logger();
    return awd::category_logger("app");
  }();
  return logger;
}

std::atomic<bool> g_running{true};

void handle_signal(int) { g_running.store(false); }

/// Send one signed delivery to a running gateway and print its answer.
int run_test_delivery(const awd::CliOptions &opts, const awd::Config &cfg) {
  if (!cfg.webhook_secret()) {
    main_log()->error("A webhook secret is required to sign test deliveries");
    return 1;
  }
  std::string payload = awd::kDefaultTestPayload;
  if (!opts.test_payload_file.empty()) {
    std::ifstream in(opts.test_payload_file, std::ios::binary);
    if (!in) {
      main_log()->error("Cannot read payload file {}",
                        opts.test_payload_file);
      return 1;
    }
    payload.assign(std::istreambuf_iterator<char>(in),
                   std::istreambuf_iterator<char>());
  }
  try {
    auto reply = awd::send_test_webhook(opts.send_test_webhook_url,
                                        *cfg.webhook_secret(), opts.test_event,
                                        payload);
    std::cout << reply.status << ' ' << reply.body << std::endl;
    return reply.status >= 200 && reply.status < 300 ? 0 : 2;
  } catch (const std::exception &e) {
    main_log()->error("{}", e.what());
    return 1;
  }
}
} // namespace

/**
 * Program entry point: resolve configuration, then serve the deploy hook
 * until SIGINT or SIGTERM arrives.
 */
int main(int argc, char **argv) {
  awd::App app;
  int ret = app.run(argc, argv);
  if (ret != 0 || app.should_exit()) {
    spdlog::shutdown();
    return ret;
  }

  const auto &opts = app.options();
  const auto &cfg = app.config();
  if (!opts.send_test_webhook_url.empty()) {
    ret = run_test_delivery(opts, cfg);
    spdlog::shutdown();
    return ret;
  }

  awd::DeployInvoker deployer(cfg.deploy_settings());
  awd::WebhookHandler handler(cfg.webhook_settings(), deployer);
  awd::HttpServer server(cfg.server_options());
  server.route("POST", awd::kDeployHookPath,
               [&handler](const awd::HttpRequest &request) {
                 return handler(request);
               });
  const std::string script = cfg.deploy_script();
  server.route("GET", "/health", [&handler, script](const awd::HttpRequest &) {
    return awd::make_json_response(200,
                                   nlohmann::json{
                                       {"status", "ok"},
                                       {"webhookConfigured", handler.configured()},
                                       {"script", script},
                                   });
  });

  try {
    server.start();
  } catch (const std::exception &e) {
    main_log()->critical("Cannot start listener: {}", e.what());
    spdlog::shutdown();
    return 1;
  }
  main_log()->info("Deploy hook ready on port {} (script {}, single-flight {})",
                   server.port(), script,
                   cfg.deploy_single_flight() ? "on" : "off");

  std::signal(SIGINT, handle_signal);
  std::signal(SIGTERM, handle_signal);
  while (g_running.load() && server.running()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }
  main_log()->info("Shutting down");
  server.stop();
  if (deployer.active() > 0) {
    main_log()->info("Waiting for {} running deploy(s) to finish",
                     deployer.active());
  }
  spdlog::shutdown();
  return 0;
}
