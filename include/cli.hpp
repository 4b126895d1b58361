/**
 * @file cli.hpp
 * @brief Command line interface parsing and options for autowebhookdeploy.
 *
 * Declares CLI parsing helpers, option structures, and the exception used to
 * request an early exit.
 */

#ifndef AUTOWEBHOOKDEPLOY_CLI_HPP
#define AUTOWEBHOOKDEPLOY_CLI_HPP

#include <cstddef>
#include <exception>
#include <optional>
#include <string>
#include <unordered_map>

namespace awd {

/**
 * Signals that CLI parsing requested an immediate exit (help, errors, etc.).
 * Used to bubble exit codes from parsing back to the main entry point without
 * treating them as fatal errors.
 */
class CliParseExit : public std::exception {
public:
  /// Construct an exit signal with the desired exit code.
  explicit CliParseExit(int exit_code) noexcept : exit_code_(exit_code) {}

  /// Exit code that should be returned to the caller.
  int exit_code() const noexcept { return exit_code_; }

  const char *what() const noexcept override {
    return "CLI parsing requested exit";
  }

private:
  int exit_code_;
};

/**
 * Parsed command line options.
 *
 * Optional members stay empty when the flag was not given so configuration
 * files and the environment can supply the value instead.
 */
struct CliOptions {
  bool verbose = false;           ///< Enables verbose output
  std::string config_file;        ///< Optional path to configuration file
  std::string log_level = "info"; ///< Logging verbosity level
  std::string log_file;           ///< Optional path to rotating log file
  int log_rotate{3}; ///< Number of rotated log files to keep (0 disables)
  bool log_compress{false};          ///< Compress rotated log files
  bool log_rotate_explicit{false};   ///< True if CLI set log rotation count
  bool log_compress_explicit{false}; ///< True if CLI toggled log compression
  std::unordered_map<std::string, std::string>
      log_categories; ///< Category -> level overrides requested via CLI
  bool log_categories_explicit{false}; ///< True if CLI specified categories

  std::optional<std::string> bind_address; ///< Listener address override
  std::optional<int> port;                 ///< Listener port override
  std::optional<std::size_t> max_body_bytes; ///< Body size limit override
  std::optional<std::string> deploy_script;  ///< Deploy script override
  std::optional<std::string> interpreter;    ///< Script interpreter override
  bool single_flight{false};          ///< Coalesce overlapping deploys
  bool single_flight_explicit{false}; ///< True if CLI toggled single-flight
  std::optional<std::string> secret_file; ///< File holding the shared secret

  std::string send_test_webhook_url; ///< Send one signed delivery and exit
  std::string test_event{"push"};    ///< Event type for the test delivery
  std::string test_payload_file;     ///< Body for the test delivery
};

/**
 * Parse command line arguments into a CliOptions structure.
 *
 * The shared secret is not accepted here; it comes from the
 * configuration file, a secret file or the environment.
 *
 * @param argc Argument count provided to @c main().
 * @param argv Argument vector provided to @c main().
 * @return Fully populated CLI options.
 * @throws CliParseExit When help or version output was requested, or when
 *         the arguments are invalid.
 */
CliOptions parse_cli(int argc, char **argv);

} // namespace awd

#endif // AUTOWEBHOOKDEPLOY_CLI_HPP
