#include "cli.hpp"
#include "log.hpp"
#include "version.hpp"

#include <CLI/CLI.hpp>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace awd {

namespace {
std::shared_ptr<spdlog::logger> cli_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("app");
  }();
  return logger;
}
} // namespace

/**
 * Parse command line arguments into a CliOptions structure.
 *
 * Toggle pairs (`--log-compress`/`--no-log-compress`,
 * `--single-flight`/`--no-single-flight`) record whether the CLI set them so
 * configuration values are only overridden on request.
 */
CliOptions parse_cli(int argc, char **argv) {
  CLI::App app{"autowebhookdeploy: signed webhook deploy gateway"};
  app.footer(log_category_help_text());
  CliOptions options;

  app.add_flag("-v,--verbose", options.verbose, "Enable verbose output")
      ->group("General");
  app.add_option("-C,--config", options.config_file,
                 "Path to configuration file (YAML, TOML or JSON)")
      ->type_name("FILE")
      ->group("General");
  app.add_flag_function(
         "--version",
         [](std::size_t) {
           std::cout << "autowebhookdeploy " << kVersionString << std::endl;
           throw CliParseExit(0);
         },
         "Show version information and exit")
      ->group("General");

  app.add_option(
         "-G,--log-level", options.log_level,
         "Set logging level (trace, debug, info, warn, error, critical, off)")
      ->type_name("LEVEL")
      ->default_val("info")
      ->group("Logging");
  app.add_option("-F,--log-file", options.log_file, "Path to rotating log file")
      ->type_name("FILE")
      ->group("Logging");
  app.add_option_function<int>(
         "--log-rotate",
         [&options](int value) {
           if (value < 0) {
             throw CLI::ValidationError("--log-rotate",
                                        "rotation count must be non-negative");
           }
           options.log_rotate = value;
           options.log_rotate_explicit = true;
         },
         "Number of rotated log files to retain (0 disables rotation)")
      ->type_name("N")
      ->group("Logging");
  auto *compress_flag = app.add_flag("--log-compress", "Compress rotated logs")
                            ->group("Logging");
  auto *no_compress_flag =
      app.add_flag("--no-log-compress", "Keep rotated logs uncompressed")
          ->group("Logging")
          ->excludes(compress_flag);
  app.add_option_function<std::string>(
         "--log-category",
         [&options](const std::string &value) {
           auto pos = value.find('=');
           std::string name =
               pos == std::string::npos ? value : value.substr(0, pos);
           std::string level = pos == std::string::npos ? std::string{"debug"}
                                                        : value.substr(pos + 1);
           if (name.empty()) {
             throw CLI::ValidationError("--log-category",
                                        "category name must not be empty");
           }
           if (level.empty()) {
             level = "debug";
           }
           options.log_categories[name] = level;
           options.log_categories_explicit = true;
         },
         "Override a logging category (NAME or NAME=LEVEL). See help footer "
         "for available categories.")
      ->type_name("NAME[=LEVEL]")
      ->group("Logging");

  std::string bind_address;
  auto *bind_option =
      app.add_option("-b,--bind", bind_address, "Address the listener binds to")
          ->type_name("ADDR")
          ->group("Server");
  int port = 0;
  auto *port_option =
      app.add_option("-p,--port", port, "Listener port (0 picks a free port)")
          ->type_name("PORT")
          ->check(CLI::Range(0, 65535))
          ->group("Server");
  std::size_t max_body = 0;
  auto *max_body_option =
      app.add_option("--max-body", max_body,
                     "Largest accepted request body in bytes")
          ->type_name("BYTES")
          ->check(CLI::Range(std::size_t{1},
                             std::numeric_limits<std::size_t>::max()))
          ->group("Server");
  std::string secret_file;
  auto *secret_file_option =
      app.add_option("--secret-file", secret_file,
                     "Read the webhook secret from FILE")
          ->type_name("FILE")
          ->group("Server");

  std::string deploy_script;
  auto *script_option =
      app.add_option("-s,--deploy-script", deploy_script,
                     "Script run for every accepted push delivery")
          ->type_name("FILE")
          ->group("Deploy");
  std::string interpreter;
  auto *interpreter_option =
      app.add_option("--interpreter", interpreter,
                     "Interpreter used to run the deploy script")
          ->type_name("PROGRAM")
          ->group("Deploy");
  auto *single_flight_flag =
      app.add_flag("--single-flight",
                   "Coalesce deliveries that arrive while a deploy runs")
          ->group("Deploy");
  auto *no_single_flight_flag =
      app.add_flag("--no-single-flight",
                   "Start one deploy per accepted delivery")
          ->group("Deploy")
          ->excludes(single_flight_flag);

  auto *send_option =
      app.add_option("--send-test-webhook", options.send_test_webhook_url,
                     "Send one signed delivery to URL and exit")
          ->type_name("URL")
          ->group("Test delivery");
  app.add_option("--event", options.test_event,
                 "Event type of the test delivery")
      ->type_name("EVENT")
      ->default_val("push")
      ->needs(send_option)
      ->group("Test delivery");
  app.add_option("--payload", options.test_payload_file,
                 "File holding the body of the test delivery")
      ->type_name("FILE")
      ->check(CLI::ExistingFile)
      ->needs(send_option)
      ->group("Test delivery");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    int exit_code = app.exit(e);
    throw CliParseExit(exit_code);
  }

  if (compress_flag->count() > 0U) {
    options.log_compress = true;
    options.log_compress_explicit = true;
  } else if (no_compress_flag->count() > 0U) {
    options.log_compress = false;
    options.log_compress_explicit = true;
  }
  if (single_flight_flag->count() > 0U) {
    options.single_flight = true;
    options.single_flight_explicit = true;
  } else if (no_single_flight_flag->count() > 0U) {
    options.single_flight = false;
    options.single_flight_explicit = true;
  }
  if (bind_option->count() > 0U) {
    options.bind_address = bind_address;
  }
  if (port_option->count() > 0U) {
    options.port = port;
  }
  if (max_body_option->count() > 0U) {
    options.max_body_bytes = max_body;
  }
  if (secret_file_option->count() > 0U) {
    options.secret_file = secret_file;
  }
  if (script_option->count() > 0U) {
    options.deploy_script = deploy_script;
  }
  if (interpreter_option->count() > 0U) {
    options.interpreter = interpreter;
  }
  cli_log()->debug("Command line parsed ({} arguments)", argc);
  return options;
}

} // namespace awd
