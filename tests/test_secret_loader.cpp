#include "secret_loader.hpp"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;

namespace {
fs::path write_temp(const std::string &name, const std::string &content) {
  fs::path path = fs::temp_directory_path() / name;
  std::ofstream f(path);
  f << content;
  return path;
}
} // namespace

TEST_CASE("normalize_secret trims and drops blanks", "[secret]") {
  REQUIRE(awd::normalize_secret("  abc \n") == std::string("abc"));
  REQUIRE(awd::normalize_secret("a b") == std::string("a b"));
  REQUIRE_FALSE(awd::normalize_secret(""));
  REQUIRE_FALSE(awd::normalize_secret(" \t\r\n"));
}

TEST_CASE("secret files in every supported format", "[secret]") {
  auto text = write_temp("awd_secret_plain", "plain-secret\n");
  REQUIRE(awd::load_secret_from_file(text.string()) ==
          std::string("plain-secret"));

  auto json = write_temp("awd_secret.json", R"({"secret":"json-secret"})");
  REQUIRE(awd::load_secret_from_file(json.string()) ==
          std::string("json-secret"));

  auto json_str = write_temp("awd_secret_str.json", R"("bare-json")");
  REQUIRE(awd::load_secret_from_file(json_str.string()) ==
          std::string("bare-json"));

  auto yaml = write_temp("awd_secret.yaml", "secret: yaml-secret\n");
  REQUIRE(awd::load_secret_from_file(yaml.string()) ==
          std::string("yaml-secret"));

  auto toml = write_temp("awd_secret.toml", "secret = \"toml-secret\"\n");
  REQUIRE(awd::load_secret_from_file(toml.string()) ==
          std::string("toml-secret"));
}

TEST_CASE("secret files without a secret yield nothing", "[secret]") {
  auto empty = write_temp("awd_secret_empty.txt", "\n\n");
  REQUIRE_FALSE(awd::load_secret_from_file(empty.string()));
  auto other = write_temp("awd_secret_other.json", R"({"token":"x"})");
  REQUIRE_FALSE(awd::load_secret_from_file(other.string()));
}

TEST_CASE("unreadable secret files raise", "[secret]") {
  REQUIRE_THROWS_AS(
      awd::load_secret_from_file(
          (fs::temp_directory_path() / "awd_missing_secret.txt").string()),
      std::runtime_error);
  auto broken = write_temp("awd_secret_broken.json", "{");
  REQUIRE_THROWS_AS(awd::load_secret_from_file(broken.string()),
                    std::runtime_error);
}
