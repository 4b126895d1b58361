#include "config.hpp"
#include "log.hpp"
#include "secret_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <initializer_list>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <toml++/toml.h>
#include <yaml-cpp/yaml.h>

namespace awd {

namespace {

std::shared_ptr<spdlog::logger> config_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("config");
  }();
  return logger;
}

std::string to_lower_copy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

/// Keys whose values are text even when they look like numbers.
bool is_string_key(const std::string &key) {
  static const std::unordered_set<std::string> keys{
      "webhook_secret", "webhook_secret_file", "deploy_script",
      "deploy_interpreter", "bind_address", "log_file", "log_pattern"};
  return keys.count(key) > 0;
}

/**
 * Convert a YAML node into a structurally equivalent JSON value.
 *
 * Quoted scalars and the values of text keys stay strings; other plain
 * scalars become booleans or numbers when they parse as such.
 */
nlohmann::json yaml_to_json(const YAML::Node &node) {
  using nlohmann::json;
  switch (node.Type()) {
  case YAML::NodeType::Null:
    return nullptr;
  case YAML::NodeType::Scalar: {
    const std::string s = node.Scalar();
    if (node.Tag() == "!") {
      return s;
    }
    if (s == "true" || s == "True" || s == "TRUE")
      return true;
    if (s == "false" || s == "False" || s == "FALSE")
      return false;
    try {
      size_t idx = 0;
      long long i = std::stoll(s, &idx, 10);
      if (idx == s.size())
        return i;
    } catch (const std::exception &) {
    }
    try {
      size_t idx = 0;
      double d = std::stod(s, &idx);
      if (idx == s.size())
        return d;
    } catch (const std::exception &) {
    }
    return s;
  }
  case YAML::NodeType::Sequence: {
    json arr = json::array();
    auto &array = arr.get_ref<json::array_t &>();
    array.reserve(node.size());
    std::transform(node.begin(), node.end(), std::back_inserter(array),
                   [](const YAML::Node &item) { return yaml_to_json(item); });
    return arr;
  }
  case YAML::NodeType::Map: {
    json obj = json::object();
    for (const auto &kv : node) {
      const std::string key = kv.first.as<std::string>();
      if (kv.second.IsScalar() && is_string_key(key)) {
        obj[key] = kv.second.Scalar();
      } else {
        obj[key] = yaml_to_json(kv.second);
      }
    }
    return obj;
  }
  default:
    return nullptr;
  }
}

/// Translate a TOML node to a JSON representation.
nlohmann::json toml_to_json(const toml::node &node) {
  using nlohmann::json;
  if (const auto *table = node.as_table()) {
    json obj = json::object();
    for (const auto &kv : *table) {
      obj[std::string(kv.first.str())] = toml_to_json(kv.second);
    }
    return obj;
  }
  if (const auto *array = node.as_array()) {
    json arr = json::array();
    for (const auto &item : *array) {
      arr.push_back(toml_to_json(item));
    }
    return arr;
  }
  if (const auto *value = node.as_boolean())
    return value->get();
  if (const auto *value = node.as_integer())
    return value->get();
  if (const auto *value = node.as_floating_point())
    return value->get();
  if (const auto *value = node.as_string())
    return value->get();
  return nullptr;
}

/**
 * Merge recognised configuration sections into the root object so grouped
 * files expose the same flat keys as flat ones.
 */
nlohmann::json normalize_config_sections(const nlohmann::json &source) {
  nlohmann::json normalized = source;
  if (!normalized.is_object()) {
    throw std::runtime_error("Configuration root must be a mapping");
  }
  for (std::string_view name : {"server", "webhook", "deploy", "logging"}) {
    auto it = normalized.find(std::string{name});
    if (it == normalized.end() || !it->is_object()) {
      continue;
    }
    const nlohmann::json section = *it;
    for (const auto &[key, value] : section.items()) {
      normalized[key] = value;
    }
  }
  return normalized;
}

int parse_port(const std::string &value, const std::string &source) {
  try {
    size_t idx = 0;
    int port = std::stoi(value, &idx);
    if (idx != value.size()) {
      throw std::invalid_argument("trailing characters");
    }
    return port;
  } catch (const std::exception &) {
    throw std::runtime_error("Invalid port '" + value + "' from " + source);
  }
}

std::optional<std::string> getenv_lookup(const std::string &name) {
  const char *value = std::getenv(name.c_str());
  if (value == nullptr) {
    return std::nullopt;
  }
  return std::string(value);
}

} // namespace

void Config::set_port(int port) {
  if (port < 0 || port > 65535) {
    throw std::runtime_error("Port out of range: " + std::to_string(port));
  }
  port_ = port;
}

void Config::set_webhook_secret(const std::string &secret) {
  webhook_secret_ = normalize_secret(secret);
}

void Config::apply_environment(const EnvLookup &lookup) {
  const EnvLookup &get = lookup ? lookup : EnvLookup{getenv_lookup};
  auto first_of = [&get](std::initializer_list<const char *> names)
      -> std::optional<std::pair<std::string, std::string>> {
    for (const char *name : names) {
      if (auto value = get(name)) {
        return std::make_pair(std::string(name), *value);
      }
    }
    return std::nullopt;
  };

  if (auto secret = first_of({"AWD_WEBHOOK_SECRET", "NODE1_WEBHOOK_SECRET"})) {
    set_webhook_secret(secret->second);
    config_log()->debug("Webhook secret taken from {} ({})", secret->first,
                        webhook_secret_ ? "set" : "blank");
  }
  if (auto script = first_of({"AWD_DEPLOY_SCRIPT", "DEPLOY_SCRIPT"})) {
    set_deploy_script(script->second);
    config_log()->debug("Deploy script taken from {}: {}", script->first,
                        deploy_script_);
  }
  if (auto port = first_of({"AWD_PORT", "PORT"})) {
    set_port(parse_port(port->second, port->first));
  }
}

void Config::resolve_secret() {
  if (webhook_secret_ || webhook_secret_file_.empty()) {
    return;
  }
  load_secret_file();
}

void Config::load_secret_file() {
  webhook_secret_ = load_secret_from_file(webhook_secret_file_);
  if (webhook_secret_) {
    config_log()->info("Webhook secret loaded from {}", webhook_secret_file_);
  } else {
    config_log()->warn("Webhook secret file {} holds no secret",
                       webhook_secret_file_);
  }
}

WebhookSettings Config::webhook_settings() const {
  WebhookSettings settings;
  settings.secret = webhook_secret_;
  return settings;
}

DeploySettings Config::deploy_settings() const {
  DeploySettings settings;
  settings.script_path = deploy_script_;
  settings.interpreter = deploy_interpreter_;
  settings.single_flight = deploy_single_flight_;
  return settings;
}

HttpServerOptions Config::server_options() const {
  HttpServerOptions options;
  options.bind_address = bind_address_;
  options.port = port_;
  options.max_body_bytes = max_body_bytes_;
  return options;
}

void Config::load_json(const nlohmann::json &j) {
  nlohmann::json cfg = normalize_config_sections(j);

  if (cfg.contains("bind_address")) {
    set_bind_address(cfg["bind_address"].get<std::string>());
  }
  if (cfg.contains("port")) {
    set_port(cfg["port"].get<int>());
  }
  if (cfg.contains("max_body_bytes")) {
    set_max_body_bytes(cfg["max_body_bytes"].get<std::size_t>());
  }
  if (cfg.contains("webhook_secret")) {
    // Unquoted YAML/TOML secrets made of digits arrive as numbers.
    const auto &secret = cfg["webhook_secret"];
    set_webhook_secret(secret.is_number() ? secret.dump()
                                          : secret.get<std::string>());
  }
  if (cfg.contains("webhook_secret_file")) {
    set_webhook_secret_file(cfg["webhook_secret_file"].get<std::string>());
  }
  if (cfg.contains("deploy_script")) {
    set_deploy_script(cfg["deploy_script"].get<std::string>());
  }
  if (cfg.contains("deploy_interpreter")) {
    set_deploy_interpreter(cfg["deploy_interpreter"].get<std::string>());
  }
  if (cfg.contains("deploy_single_flight")) {
    set_deploy_single_flight(cfg["deploy_single_flight"].get<bool>());
  }
  if (cfg.contains("log_level")) {
    set_log_level(cfg["log_level"].get<std::string>());
  }
  if (cfg.contains("log_pattern")) {
    set_log_pattern(cfg["log_pattern"].get<std::string>());
  }
  if (cfg.contains("log_file")) {
    set_log_file(cfg["log_file"].get<std::string>());
  }
  if (cfg.contains("log_rotate")) {
    set_log_rotate(cfg["log_rotate"].get<int>());
  }
  if (cfg.contains("log_compress")) {
    set_log_compress(cfg["log_compress"].get<bool>());
  }
  if (cfg.contains("log_categories")) {
    const auto &node = cfg["log_categories"];
    if (!node.is_object()) {
      throw std::runtime_error("log_categories must be a mapping");
    }
    std::unordered_map<std::string, std::string> categories;
    for (const auto &[name, level] : node.items()) {
      categories[name] = to_lower_copy(level.get<std::string>());
    }
    set_log_categories(std::move(categories));
  }
}

Config Config::from_json(const nlohmann::json &j) {
  Config cfg;
  cfg.load_json(j);
  return cfg;
}

Config Config::from_file(const std::string &path) {
  config_log()->debug("Loading config from {}", path);
  auto pos = path.find_last_of('.');
  if (pos == std::string::npos) {
    config_log()->error("Unknown config file extension for {}", path);
    throw std::runtime_error("Unknown config file extension");
  }
  const std::string ext = to_lower_copy(path.substr(pos + 1));
  nlohmann::json j;
  try {
    if (ext == "yaml" || ext == "yml") {
      j = yaml_to_json(YAML::LoadFile(path));
    } else if (ext == "json") {
      std::ifstream f(path);
      if (!f) {
        throw std::runtime_error("Failed to open config file");
      }
      f >> j;
    } else if (ext == "toml" || ext == "tml") {
      toml::table tbl = toml::parse_file(path);
      j = toml_to_json(tbl);
    } else {
      throw std::runtime_error("Unsupported config format: " + ext);
    }
  } catch (const std::exception &e) {
    config_log()->error("Failed to load config {}: {}", path, e.what());
    throw std::runtime_error("Failed to load config " + path + ": " +
                             e.what());
  }
  Config cfg;
  cfg.load_json(j);
  config_log()->info("Config loaded from {}", path);
  return cfg;
}

} // namespace awd
