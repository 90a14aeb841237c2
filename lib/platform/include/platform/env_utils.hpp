#pragma once

#include <optional>
#include <string>

namespace vine_sync::platform {

/**
 * @brief Reads an environment variable.
 *
 * @param name Variable name
 * @return Value, or std::nullopt if unset or empty
 */
[[nodiscard]] auto get_env(const std::string &name) -> std::optional<std::string>;

/**
 * @brief Returns the user's home directory path.
 *
 * @return Home directory path, empty if unknown
 */
[[nodiscard]] auto get_home_directory() -> std::string;

/**
 * @brief Expands tilde (~) in path to home directory.
 *
 * @param path Path possibly containing ~
 * @return Expanded absolute path
 */
[[nodiscard]] auto expand_tilde_path(const std::string &path) -> std::string;

/**
 * @brief Default directory of the local cache.
 *
 * $XDG_CACHE_HOME/vine_sync when set, otherwise ~/.cache/vine_sync
 * (%LOCALAPPDATA%\vine_sync on Windows).
 */
[[nodiscard]] auto default_cache_directory() -> std::string;

}// namespace vine_sync::platform
