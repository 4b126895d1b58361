#include "secret_loader.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <toml++/toml.h>
#include <yaml-cpp/yaml.h>

namespace awd {

std::optional<std::string> normalize_secret(const std::string &value) {
  auto not_space = [](unsigned char c) { return !std::isspace(c); };
  auto begin = std::find_if(value.begin(), value.end(), not_space);
  auto end = std::find_if(value.rbegin(), value.rend(), not_space).base();
  if (begin >= end) {
    return std::nullopt;
  }
  return std::string(begin, end);
}

std::optional<std::string> load_secret_from_file(const std::string &path) {
  std::string ext = std::filesystem::path(path).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  std::string secret;
  try {
    if (ext == ".yaml" || ext == ".yml") {
      YAML::Node node = YAML::LoadFile(path);
      if (node.IsScalar()) {
        secret = node.as<std::string>();
      } else if (node.IsMap() && node["secret"]) {
        secret = node["secret"].as<std::string>();
      }
    } else if (ext == ".json") {
      std::ifstream f(path);
      if (!f) {
        throw std::runtime_error("cannot open file");
      }
      nlohmann::json j;
      f >> j;
      if (j.is_string()) {
        secret = j.get<std::string>();
      } else if (j.is_object() && j.contains("secret")) {
        secret = j["secret"].get<std::string>();
      }
    } else if (ext == ".toml" || ext == ".tml") {
      toml::table tbl = toml::parse_file(path);
      if (auto value = tbl["secret"].value<std::string>()) {
        secret = *value;
      }
    } else {
      std::ifstream f(path, std::ios::binary);
      if (!f) {
        throw std::runtime_error("cannot open file");
      }
      secret.assign(std::istreambuf_iterator<char>(f),
                    std::istreambuf_iterator<char>());
    }
  } catch (const std::exception &e) {
    throw std::runtime_error("Failed to load secret file " + path + ": " +
                             e.what());
  }
  return normalize_secret(secret);
}

} // namespace awd
