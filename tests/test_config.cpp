#include "config.hpp"

#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <map>
#include <string>

namespace fs = std::filesystem;

namespace {

fs::path write_temp(const std::string &name, const std::string &content) {
  fs::path path = fs::temp_directory_path() / name;
  std::ofstream f(path);
  f << content;
  return path;
}

awd::Config::EnvLookup fake_env(std::map<std::string, std::string> values) {
  return [values](const std::string &name) -> std::optional<std::string> {
    auto it = values.find(name);
    if (it == values.end()) {
      return std::nullopt;
    }
    return it->second;
  };
}

} // namespace

TEST_CASE("config defaults", "[config]") {
  awd::Config cfg;
  REQUIRE(cfg.bind_address() == "0.0.0.0");
  REQUIRE(cfg.port() == 3040);
  REQUIRE(cfg.max_body_bytes() == 1024 * 1024);
  REQUIRE_FALSE(cfg.webhook_secret());
  REQUIRE(cfg.deploy_script() == "scripts/deploy.sh");
  REQUIRE(cfg.deploy_interpreter() == "bash");
  REQUIRE_FALSE(cfg.deploy_single_flight());
  REQUIRE(cfg.log_level() == "info");
  REQUIRE(cfg.log_rotate() == 3);
}

TEST_CASE("config loads grouped YAML", "[config]") {
  auto path = write_temp("awd_cfg.yaml", "server:\n"
                                         "  bind_address: 127.0.0.1\n"
                                         "  port: 8080\n"
                                         "  max_body_bytes: 2048\n"
                                         "webhook:\n"
                                         "  webhook_secret: \"0123\"\n"
                                         "deploy:\n"
                                         "  deploy_script: /srv/pull.sh\n"
                                         "  deploy_interpreter: sh\n"
                                         "  deploy_single_flight: true\n"
                                         "logging:\n"
                                         "  log_level: debug\n"
                                         "  log_categories:\n"
                                         "    deploy: TRACE\n");
  auto cfg = awd::Config::from_file(path.string());
  REQUIRE(cfg.bind_address() == "127.0.0.1");
  REQUIRE(cfg.port() == 8080);
  REQUIRE(cfg.max_body_bytes() == 2048);
  REQUIRE(cfg.webhook_secret() == std::string("0123"));
  REQUIRE(cfg.deploy_script() == "/srv/pull.sh");
  REQUIRE(cfg.deploy_interpreter() == "sh");
  REQUIRE(cfg.deploy_single_flight());
  REQUIRE(cfg.log_level() == "debug");
  REQUIRE(cfg.log_categories().at("deploy") == "trace");
}

TEST_CASE("config loads flat TOML and JSON", "[config]") {
  auto toml = write_temp("awd_cfg.toml", "port = 9000\n"
                                         "webhook_secret = \"  spaced  \"\n"
                                         "deploy_script = \"run.sh\"\n");
  auto tcfg = awd::Config::from_file(toml.string());
  REQUIRE(tcfg.port() == 9000);
  REQUIRE(tcfg.webhook_secret() == std::string("spaced"));
  REQUIRE(tcfg.deploy_script() == "run.sh");

  nlohmann::json doc;
  doc["server"] = {{"port", 7000}};
  doc["webhook"] = {{"webhook_secret", 12345}};
  auto json = write_temp("awd_cfg.json", doc.dump());
  auto jcfg = awd::Config::from_file(json.string());
  REQUIRE(jcfg.port() == 7000);
  REQUIRE(jcfg.webhook_secret() == std::string("12345"));
}

TEST_CASE("config rejects bad input", "[config]") {
  REQUIRE_THROWS_AS(awd::Config::from_file("awd_cfg.ini"), std::runtime_error);
  REQUIRE_THROWS_AS(awd::Config::from_file("no_extension"),
                    std::runtime_error);
  auto broken = write_temp("awd_broken.json", "{not json");
  REQUIRE_THROWS_AS(awd::Config::from_file(broken.string()),
                    std::runtime_error);
  REQUIRE_THROWS(awd::Config::from_json(nlohmann::json{{"port", 70000}}));
  REQUIRE_THROWS(awd::Config::from_json(nlohmann::json::array()));
}

TEST_CASE("blank secret counts as not configured", "[config]") {
  awd::Config cfg;
  cfg.set_webhook_secret("   \n");
  REQUIRE_FALSE(cfg.webhook_secret());
  REQUIRE_FALSE(cfg.webhook_settings().secret);
}

TEST_CASE("environment overrides file values", "[config]") {
  awd::Config cfg = awd::Config::from_json(
      nlohmann::json{{"port", 1000}, {"deploy_script", "file.sh"}});
  cfg.apply_environment(fake_env({{"AWD_WEBHOOK_SECRET", "from-env"},
                                  {"DEPLOY_SCRIPT", "env.sh"},
                                  {"PORT", "4000"}}));
  REQUIRE(cfg.webhook_secret() == std::string("from-env"));
  REQUIRE(cfg.deploy_script() == "env.sh");
  REQUIRE(cfg.port() == 4000);
}

TEST_CASE("primary environment names win over legacy ones", "[config]") {
  awd::Config cfg;
  cfg.apply_environment(fake_env({{"AWD_WEBHOOK_SECRET", "primary"},
                                  {"NODE1_WEBHOOK_SECRET", "legacy"},
                                  {"AWD_PORT", "5000"},
                                  {"PORT", "6000"}}));
  REQUIRE(cfg.webhook_secret() == std::string("primary"));
  REQUIRE(cfg.port() == 5000);

  awd::Config legacy;
  legacy.apply_environment(fake_env({{"NODE1_WEBHOOK_SECRET", "legacy"}}));
  REQUIRE(legacy.webhook_secret() == std::string("legacy"));
}

TEST_CASE("invalid environment port is an error", "[config]") {
  awd::Config cfg;
  REQUIRE_THROWS_AS(cfg.apply_environment(fake_env({{"PORT", "80x"}})),
                    std::runtime_error);
  REQUIRE_THROWS_AS(cfg.apply_environment(fake_env({{"AWD_PORT", "99999"}})),
                    std::runtime_error);
}

TEST_CASE("secret file is used only when no secret is set", "[config]") {
  auto file = write_temp("awd_secret.txt", "file-secret\n");
  awd::Config cfg;
  cfg.set_webhook_secret_file(file.string());
  cfg.resolve_secret();
  REQUIRE(cfg.webhook_secret() == std::string("file-secret"));

  awd::Config direct;
  direct.set_webhook_secret("direct");
  direct.set_webhook_secret_file(file.string());
  direct.resolve_secret();
  REQUIRE(direct.webhook_secret() == std::string("direct"));

  awd::Config missing;
  missing.set_webhook_secret_file(
      (fs::temp_directory_path() / "awd_no_secret_here.txt").string());
  REQUIRE_THROWS_AS(missing.resolve_secret(), std::runtime_error);
}

TEST_CASE("settings structures reflect the configuration", "[config]") {
  awd::Config cfg;
  cfg.set_bind_address("127.0.0.1");
  cfg.set_port(0);
  cfg.set_max_body_bytes(10);
  cfg.set_deploy_script("x.sh");
  cfg.set_deploy_interpreter("sh");
  cfg.set_deploy_single_flight(true);
  cfg.set_webhook_secret("k");

  auto server = cfg.server_options();
  REQUIRE(server.bind_address == "127.0.0.1");
  REQUIRE(server.port == 0);
  REQUIRE(server.max_body_bytes == 10);

  auto deploy = cfg.deploy_settings();
  REQUIRE(deploy.script_path == "x.sh");
  REQUIRE(deploy.interpreter == "sh");
  REQUIRE(deploy.single_flight);

  REQUIRE(cfg.webhook_settings().secret == std::string("k"));
}

TEST_CASE("unquoted numeric-looking YAML secrets keep their text",
          "[config]") {
  auto path = write_temp("awd_cfg_numeric.yaml", "webhook_secret: 00123\n"
                                                 "deploy_script: 1.50\n"
                                                 "port: 8081\n");
  auto cfg = awd::Config::from_file(path.string());
  REQUIRE(cfg.webhook_secret() == std::string("00123"));
  REQUIRE(cfg.deploy_script() == "1.50");
  REQUIRE(cfg.port() == 8081);

  auto grouped = write_temp("awd_cfg_numeric_grouped.yaml",
                            "webhook:\n  webhook_secret: 123e4\n");
  auto gcfg = awd::Config::from_file(grouped.string());
  REQUIRE(gcfg.webhook_secret() == std::string("123e4"));
}

TEST_CASE("loading the secret file replaces an existing secret",
          "[config]") {
  auto file = write_temp("awd_secret_replace.txt", "b\n");
  awd::Config cfg;
  cfg.apply_environment(fake_env({{"AWD_WEBHOOK_SECRET", "a"}}));
  cfg.set_webhook_secret_file(file.string());
  cfg.load_secret_file();
  REQUIRE(cfg.webhook_secret() == std::string("b"));
}
