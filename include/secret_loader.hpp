/**
 * @file secret_loader.hpp
 * @brief Loading of the shared webhook secret.
 *
 * Declares helpers that read the webhook secret from a file and normalise
 * secret values so blank input counts as "not configured".
 */
#ifndef AUTOWEBHOOKDEPLOY_SECRET_LOADER_HPP
#define AUTOWEBHOOKDEPLOY_SECRET_LOADER_HPP

#include <optional>
#include <string>

namespace awd {

/**
 * Trim surrounding whitespace from a secret.
 *
 * @return The trimmed secret, or `std::nullopt` when nothing remains.
 */
std::optional<std::string> normalize_secret(const std::string &value);

/**
 * Load the webhook secret from a file.
 *
 * JSON, YAML and TOML files must hold a `secret` string (JSON and YAML files
 * may also be a bare string). Files with any other extension are read as
 * plain text.
 *
 * @param path Filesystem path to the secret file
 * @return The normalised secret, or `std::nullopt` when the file holds none
 * @throws std::runtime_error on read or parse errors
 */
std::optional<std::string> load_secret_from_file(const std::string &path);

} // namespace awd

#endif // AUTOWEBHOOKDEPLOY_SECRET_LOADER_HPP
