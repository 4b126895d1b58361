/**
 * @file log.hpp
 * @brief Logging utilities for autowebhookdeploy.
 *
 * Declares logger initialization, category loggers, and log category
 * configuration shared by the listener, the webhook handler and the deploy
 * invoker.
 */

#ifndef AUTOWEBHOOKDEPLOY_LOG_HPP
#define AUTOWEBHOOKDEPLOY_LOG_HPP

#include <cstddef>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>

namespace awd {

/**
 * Initialize the global logger with console and optional rotating file sinks.
 *
 * @param level Logging verbosity level to use for all loggers.
 * @param pattern Log message pattern. Provide an empty string to keep the
 *        underlying spdlog default.
 * @param file Optional log file path for enabling a rotating sink. When empty
 *        no file output is configured.
 * @param rotate_files Maximum number of rotated files to retain when
 *        @p file is provided. Zero writes a single non-rotating file.
 * @param compress_rotations Whether rotated log files should be gzip
 *        compressed automatically.
 */
void init_logger(spdlog::level::level_enum level,
                 const std::string &pattern = "", const std::string &file = "",
                 std::size_t rotate_files = 3, bool compress_rotations = false);

/**
 * Retrieve or create a logger dedicated to a specific category.
 *
 * Category loggers share sinks with the default logger so messages appear in
 * the same destinations. They allow fine-grained log-level overrides.
 *
 * @param category Category name, registered as `awd.<category>`.
 * @return Shared pointer to the category logger.
 */
std::shared_ptr<spdlog::logger> category_logger(const std::string &category);

/**
 * Apply log level overrides for specific categories.
 *
 * @param overrides Mapping of category name to desired log level.
 */
void configure_log_categories(
    const std::unordered_map<std::string, spdlog::level::level_enum>
        &overrides);

/**
 * Ensure a default logger exists before logging.
 *
 * Creates one on demand when the logging subsystem has not been explicitly
 * initialized, e.g. when a component is used directly from a test.
 */
void ensure_default_logger();

/// Categories understood by the gateway, used for CLI help output.
const char *log_category_help_text();

} // namespace awd

#endif // AUTOWEBHOOKDEPLOY_LOG_HPP
