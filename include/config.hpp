/**
 * @file config.hpp
 * @brief Configuration for autowebhookdeploy.
 *
 * Declares the Config class that loads gateway settings from YAML, TOML or
 * JSON files and the environment, and converts them into the settings
 * structures consumed by the listener, the handler and the deploy invoker.
 */

#ifndef AUTOWEBHOOKDEPLOY_CONFIG_HPP
#define AUTOWEBHOOKDEPLOY_CONFIG_HPP

#include "deploy.hpp"
#include "http_server.hpp"
#include "webhook_handler.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>

#include <nlohmann/json_fwd.hpp>

namespace awd {

/// Application configuration loaded from a YAML, TOML, or JSON file.
class Config {
public:
  /// Looks up an environment variable; returns nullopt when unset.
  using EnvLookup =
      std::function<std::optional<std::string>(const std::string &)>;

  /// Address the listener binds to.
  const std::string &bind_address() const { return bind_address_; }

  /// Set listener bind address.
  void set_bind_address(const std::string &address) {
    bind_address_ = address;
  }

  /// Listener port.
  int port() const { return port_; }

  /// Set listener port.
  /// @throws std::runtime_error When @p port is outside 0-65535.
  void set_port(int port);

  /// Largest accepted request body in bytes.
  std::size_t max_body_bytes() const { return max_body_bytes_; }

  /// Set largest accepted request body.
  void set_max_body_bytes(std::size_t bytes) { max_body_bytes_ = bytes; }

  /// Shared webhook secret, absent when not configured.
  const std::optional<std::string> &webhook_secret() const {
    return webhook_secret_;
  }

  /// Set the shared secret. Blank values (after trimming) clear it.
  void set_webhook_secret(const std::string &secret);

  /// File the secret is read from when no secret is set directly.
  const std::string &webhook_secret_file() const {
    return webhook_secret_file_;
  }

  /// Set the secret file path.
  void set_webhook_secret_file(const std::string &path) {
    webhook_secret_file_ = path;
  }

  /// Deploy script path.
  const std::string &deploy_script() const { return deploy_script_; }

  /// Set deploy script path.
  void set_deploy_script(const std::string &path) { deploy_script_ = path; }

  /// Interpreter used to run the deploy script.
  const std::string &deploy_interpreter() const { return deploy_interpreter_; }

  /// Set interpreter used to run the deploy script.
  void set_deploy_interpreter(const std::string &interpreter) {
    deploy_interpreter_ = interpreter;
  }

  /// Whether overlapping deploys are coalesced.
  bool deploy_single_flight() const { return deploy_single_flight_; }

  /// Enable or disable the single-flight guard.
  void set_deploy_single_flight(bool enable) {
    deploy_single_flight_ = enable;
  }

  /// Get logging verbosity level.
  const std::string &log_level() const { return log_level_; }

  /// Set logging verbosity level.
  void set_log_level(const std::string &level) { log_level_ = level; }

  /// Get logging pattern.
  const std::string &log_pattern() const { return log_pattern_; }

  /// Set logging pattern.
  void set_log_pattern(const std::string &pattern) { log_pattern_ = pattern; }

  /// Path to rotating log file.
  const std::string &log_file() const { return log_file_; }

  /// Set path for rotating log file.
  void set_log_file(const std::string &file) { log_file_ = file; }

  /// Number of rotated log files to retain (0 disables rotation).
  int log_rotate() const { return log_rotate_; }

  /// Set number of rotated log files to retain.
  void set_log_rotate(int count) { log_rotate_ = count < 0 ? 0 : count; }

  /// Whether rotated log files are compressed.
  bool log_compress() const { return log_compress_; }

  /// Enable or disable compression of rotated log files.
  void set_log_compress(bool enable) { log_compress_ = enable; }

  /// Retrieve configured log category overrides.
  const std::unordered_map<std::string, std::string> &log_categories() const {
    return log_categories_;
  }

  /// Replace configured log category overrides.
  void set_log_categories(std::unordered_map<std::string, std::string> values) {
    log_categories_ = std::move(values);
  }

  /**
   * Apply environment overrides.
   *
   * Recognised variables: `AWD_WEBHOOK_SECRET` (or `NODE1_WEBHOOK_SECRET`),
   * `AWD_DEPLOY_SCRIPT` (or `DEPLOY_SCRIPT`) and `AWD_PORT` (or `PORT`).
   *
   * @param lookup Environment accessor; defaults to `std::getenv`.
   * @throws std::runtime_error When a port value is not a valid number.
   */
  void apply_environment(const EnvLookup &lookup = EnvLookup{});

  /**
   * Load the secret from @ref webhook_secret_file when no secret is set.
   *
   * @throws std::runtime_error When the file cannot be read or parsed.
   */
  void resolve_secret();

  /**
   * Replace the current secret with the contents of
   * @ref webhook_secret_file, whatever its earlier source.
   *
   * @throws std::runtime_error When the file cannot be read or parsed.
   */
  void load_secret_file();

  /// Settings for the webhook handler.
  WebhookSettings webhook_settings() const;

  /// Settings for the deploy invoker.
  DeploySettings deploy_settings() const;

  /// Options for the HTTP listener.
  HttpServerOptions server_options() const;

  /**
   * Populate configuration settings from a JSON object.
   *
   * Grouped sections (`server`, `webhook`, `deploy`, `logging`) are flattened
   * before the keys are read.
   *
   * @throws nlohmann::json::exception When values have the wrong type.
   */
  void load_json(const nlohmann::json &j);

  /// Construct a configuration object from a JSON representation.
  static Config from_json(const nlohmann::json &j);

  /**
   * Load configuration from a file on disk.
   *
   * The file type is inferred from the extension and may be YAML, JSON, or
   * TOML.
   *
   * @throws std::runtime_error When the file cannot be opened or parsed, or
   *         when the extension is unsupported.
   */
  static Config from_file(const std::string &path);

private:
  std::string bind_address_{"0.0.0.0"};
  int port_{3040};
  std::size_t max_body_bytes_{1024 * 1024};
  std::optional<std::string> webhook_secret_;
  std::string webhook_secret_file_;
  std::string deploy_script_{"scripts/deploy.sh"};
  std::string deploy_interpreter_{"bash"};
  bool deploy_single_flight_{false};
  std::string log_level_{"info"};
  std::string log_pattern_;
  std::string log_file_;
  int log_rotate_{3};
  bool log_compress_{false};
  std::unordered_map<std::string, std::string> log_categories_;
};

} // namespace awd

#endif // AUTOWEBHOOKDEPLOY_CONFIG_HPP
