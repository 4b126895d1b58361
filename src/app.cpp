#include "app.hpp"
#include "log.hpp"

#include <exception>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>

namespace awd {

namespace {
std::shared_ptr<spdlog::logger> app_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("app");
  }();
  return logger;
}
} // namespace

/**
 * Execute startup.
 *
 * Configuration problems (unreadable files, bad ports, an unreadable secret
 * file) are logged and reported as exit code 1; help and version requests
 * exit with the code CLI11 chose.
 */
int App::run(int argc, char **argv) {
  should_exit_ = false;
  try {
    options_ = parse_cli(argc, argv);
  } catch (const CliParseExit &exit) {
    should_exit_ = true;
    return exit.exit_code();
  } catch (const std::exception &e) {
    app_log()->error("{}", e.what());
    should_exit_ = true;
    return 1;
  }

  try {
    config_ = options_.config_file.empty()
                  ? Config{}
                  : Config::from_file(options_.config_file);
    config_.apply_environment();
    apply_cli_overrides();
    config_.resolve_secret();
  } catch (const std::exception &e) {
    app_log()->error("Configuration error: {}", e.what());
    should_exit_ = true;
    return 1;
  }

  init_logging();
  if (options_.verbose) {
    app_log()->debug("Verbose mode enabled");
  }
  if (!config_.webhook_secret()) {
    app_log()->warn("No webhook secret configured; deliveries will be "
                    "refused with 503");
  }
  return 0;
}

void App::apply_cli_overrides() {
  if (options_.bind_address) {
    config_.set_bind_address(*options_.bind_address);
  }
  if (options_.port) {
    config_.set_port(*options_.port);
  }
  if (options_.max_body_bytes) {
    config_.set_max_body_bytes(*options_.max_body_bytes);
  }
  if (options_.secret_file) {
    config_.set_webhook_secret_file(*options_.secret_file);
    config_.load_secret_file();
  }
  if (options_.deploy_script) {
    config_.set_deploy_script(*options_.deploy_script);
  }
  if (options_.interpreter) {
    config_.set_deploy_interpreter(*options_.interpreter);
  }
  if (options_.single_flight_explicit) {
    config_.set_deploy_single_flight(options_.single_flight);
  }
  if (!options_.log_file.empty()) {
    config_.set_log_file(options_.log_file);
  }
  if (options_.log_rotate_explicit) {
    config_.set_log_rotate(options_.log_rotate);
  }
  if (options_.log_compress_explicit) {
    config_.set_log_compress(options_.log_compress);
  }
  if (options_.log_categories_explicit) {
    auto categories = config_.log_categories();
    for (const auto &[name, level] : options_.log_categories) {
      categories[name] = level;
    }
    config_.set_log_categories(std::move(categories));
  }
}

void App::init_logging() {
  std::string level_str = options_.verbose ? "debug" : "info";
  if (options_.log_level != "info") {
    level_str = options_.log_level;
  } else if (config_.log_level() != "info") {
    level_str = config_.log_level();
  }
  spdlog::level::level_enum lvl = spdlog::level::from_str(level_str);
  if (lvl == spdlog::level::off && level_str != "off") {
    app_log()->warn("Unknown log level '{}'; using info", level_str);
    lvl = spdlog::level::info;
  }
  init_logger(lvl, config_.log_pattern(), config_.log_file(),
              static_cast<std::size_t>(config_.log_rotate()),
              config_.log_compress());
  std::unordered_map<std::string, spdlog::level::level_enum> category_levels;
  for (const auto &[category, level] : config_.log_categories()) {
    auto parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off") {
      app_log()->warn("Ignoring invalid log level '{}' for category '{}'",
                      level, category);
      continue;
    }
    category_levels[category] = parsed;
  }
  configure_log_categories(category_levels);
}

} // namespace awd
