#include "log.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <spdlog/spdlog.h>
#include <string>

namespace {
std::string slurp(const std::string &path) {
  std::ifstream f(path);
  return std::string((std::istreambuf_iterator<char>(f)),
                     std::istreambuf_iterator<char>());
}
} // namespace

TEST_CASE("test log", "[log]") {
  const char *path = "awd_test.log";
  std::remove(path);
  awd::init_logger(spdlog::level::info, "", path);
  spdlog::debug("debug message");
  spdlog::info("info message");
  spdlog::shutdown();
  std::ifstream f(path);
  REQUIRE(f.good());
  std::string content = slurp(path);
  REQUIRE(content.find("info message") != std::string::npos);
  REQUIRE(content.find("debug message") == std::string::npos);
  std::remove(path);
}

TEST_CASE("category overrides", "[log]") {
  const char *path = "awd_category.log";
  std::remove(path);
  awd::init_logger(spdlog::level::info, "", path);
  awd::configure_log_categories({{"deploy", spdlog::level::debug}});
  auto deploy = awd::category_logger("deploy");
  auto http = awd::category_logger("http");
  REQUIRE(deploy->name() == "awd.deploy");
  deploy->debug("deploy detail");
  http->debug("http detail");
  http->info("http summary");
  spdlog::shutdown();
  std::string content = slurp(path);
  REQUIRE(content.find("deploy detail") != std::string::npos);
  REQUIRE(content.find("http detail") == std::string::npos);
  REQUIRE(content.find("http summary") != std::string::npos);
  std::remove(path);
}

TEST_CASE("category help lists the gateway categories", "[log]") {
  std::string help = awd::log_category_help_text();
  REQUIRE(help.find("security") != std::string::npos);
  REQUIRE(help.find("deploy") != std::string::npos);
}

TEST_CASE("file sink is attached after an implicit default logger", "[log]") {
  const char *path = "awd_late_file.log";
  std::remove(path);
  awd::ensure_default_logger();
  auto early = awd::category_logger("app");
  early->info("before the file exists");
  awd::init_logger(spdlog::level::debug, "", path, 3, false);
  REQUIRE(early->level() == spdlog::level::debug);
  early->debug("early category detail");
  awd::category_logger("deploy")->error("deploy failed marker");
  spdlog::shutdown();
  std::string content = slurp(path);
  REQUIRE(content.find("deploy failed marker") != std::string::npos);
  REQUIRE(content.find("early category detail") != std::string::npos);
  std::remove(path);
}
