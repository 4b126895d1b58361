/**
 * @file app.hpp
 * @brief Startup orchestration for autowebhookdeploy.
 *
 * Declares the App class, which parses the command line, layers the
 * configuration file, the environment and CLI overrides, and initializes
 * logging before the gateway starts.
 */

#ifndef AUTOWEBHOOKDEPLOY_APP_HPP
#define AUTOWEBHOOKDEPLOY_APP_HPP

#include "cli.hpp"
#include "config.hpp"

namespace awd {

/**
 * Resolves everything the gateway needs before serving.
 *
 * Precedence, highest first: command line, environment, configuration file,
 * built-in defaults.
 */
class App {
public:
  /**
   * Run startup with the given command line arguments.
   *
   * @param argc Number of CLI arguments supplied to the executable.
   * @param argv Null-terminated array containing the raw CLI arguments.
   * @return Zero on success, non-zero when startup failed.
   */
  int run(int argc, char **argv);

  /// Parsed command line options.
  const CliOptions &options() const { return options_; }

  /// Resolved configuration.
  const Config &config() const { return config_; }

  /// Whether the process should exit right after run() returns.
  bool should_exit() const { return should_exit_; }

private:
  void apply_cli_overrides();
  void init_logging();

  CliOptions options_;
  Config config_;
  bool should_exit_{false};
};

} // namespace awd

#endif // AUTOWEBHOOKDEPLOY_APP_HPP
