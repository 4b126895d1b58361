#include "cli.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

namespace {
awd::CliOptions parse(std::vector<std::string> args) {
  args.insert(args.begin(), "prog");
  std::vector<char *> argv;
  for (auto &arg : args) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);
  return awd::parse_cli(static_cast<int>(args.size()), argv.data());
}
} // namespace

TEST_CASE("test cli defaults", "[cli]") {
  auto opts = parse({});
  REQUIRE_FALSE(opts.verbose);
  REQUIRE(opts.config_file.empty());
  REQUIRE(opts.log_level == "info");
  REQUIRE_FALSE(opts.port);
  REQUIRE_FALSE(opts.deploy_script);
  REQUIRE_FALSE(opts.single_flight_explicit);
  REQUIRE(opts.send_test_webhook_url.empty());
}

TEST_CASE("test cli general and logging flags", "[cli]") {
  auto opts = parse({"--verbose", "--config", "cfg.yaml", "--log-level",
                     "debug", "--log-file", "awd.log", "--log-rotate", "5",
                     "--log-compress", "--log-category", "deploy=trace",
                     "--log-category", "http"});
  REQUIRE(opts.verbose);
  REQUIRE(opts.config_file == "cfg.yaml");
  REQUIRE(opts.log_level == "debug");
  REQUIRE(opts.log_file == "awd.log");
  REQUIRE(opts.log_rotate == 5);
  REQUIRE(opts.log_rotate_explicit);
  REQUIRE(opts.log_compress);
  REQUIRE(opts.log_compress_explicit);
  REQUIRE(opts.log_categories.at("deploy") == "trace");
  REQUIRE(opts.log_categories.at("http") == "debug");
  REQUIRE(opts.log_categories_explicit);

  auto off = parse({"--no-log-compress"});
  REQUIRE_FALSE(off.log_compress);
  REQUIRE(off.log_compress_explicit);
}

TEST_CASE("test cli server and deploy flags", "[cli]") {
  auto opts = parse({"-b", "127.0.0.1", "-p", "0", "--max-body", "4096",
                     "-s", "/srv/pull.sh", "--interpreter", "sh",
                     "--single-flight", "--secret-file", "/run/secret"});
  REQUIRE(opts.bind_address == std::string("127.0.0.1"));
  REQUIRE(opts.port == 0);
  REQUIRE(opts.max_body_bytes == std::size_t{4096});
  REQUIRE(opts.deploy_script == std::string("/srv/pull.sh"));
  REQUIRE(opts.interpreter == std::string("sh"));
  REQUIRE(opts.single_flight);
  REQUIRE(opts.single_flight_explicit);
  REQUIRE(opts.secret_file == std::string("/run/secret"));

  auto no_sf = parse({"--no-single-flight"});
  REQUIRE_FALSE(no_sf.single_flight);
  REQUIRE(no_sf.single_flight_explicit);
}

TEST_CASE("test cli test delivery flags", "[cli]") {
  auto opts = parse({"--send-test-webhook", "http://127.0.0.1:3040/hooks/deploy",
                     "--event", "ping"});
  REQUIRE(opts.send_test_webhook_url == "http://127.0.0.1:3040/hooks/deploy");
  REQUIRE(opts.test_event == "ping");

  auto defaults = parse({"--send-test-webhook", "http://localhost/"});
  REQUIRE(defaults.test_event == "push");
}

TEST_CASE("test cli errors request an exit", "[cli]") {
  REQUIRE_THROWS_AS(parse({"--port", "70000"}), awd::CliParseExit);
  REQUIRE_THROWS_AS(parse({"--log-rotate", "-1"}), awd::CliParseExit);
  REQUIRE_THROWS_AS(parse({"--unknown-flag"}), awd::CliParseExit);
  REQUIRE_THROWS_AS(parse({"--event", "push"}), awd::CliParseExit);
  REQUIRE_THROWS_AS(parse({"--secret", "abc"}), awd::CliParseExit);

  try {
    parse({"--version"});
    FAIL("--version should request an exit");
  } catch (const awd::CliParseExit &e) {
    REQUIRE(e.exit_code() == 0);
  }
  try {
    parse({"--help"});
    FAIL("--help should request an exit");
  } catch (const awd::CliParseExit &e) {
    REQUIRE(e.exit_code() == 0);
  }
}
