#pragma once

#include <engine/sync_engine.hpp>
#include <storage/cache_persister.hpp>
#include <subscription/subscription_types.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace vine_sync::config {

/// Local cache settings
struct cache_config
{
  std::string directory;///< Defaults to platform::default_cache_directory()
  std::string key_namespace{ storage::default_cache_namespace };
  double corruption_threshold{ storage::default_corruption_threshold };
};

/// Logging settings
struct logging_config
{
  std::string level{ "info" };///< trace, debug, info, warn, error, critical or off
  std::optional<std::string> file;///< Rotating log file, console only when unset
  std::size_t max_file_size{ 5UL * 1024UL * 1024UL };
  std::size_t max_files{ 3 };
};

/**
 * @brief Complete engine configuration.
 */
struct engine_config
{
  subscription::subscription_config subscriptions;
  cache_config cache;
  logging_config logging;
  std::size_t queue_capacity{ async::async_queue<nostr::protocol::event_data>::default_capacity };
  std::size_t max_batch_size{ engine::default_max_batch_size };

  /// Options handed to engine::sync_engine
  [[nodiscard]] auto engine_options() const -> engine::sync_engine_options;
};

/**
 * @brief Configuration with every default applied.
 */
[[nodiscard]] auto default_engine_config() -> engine_config;

/**
 * @brief Builds a configuration from JSON; missing keys keep their defaults.
 *
 * @throws std::invalid_argument on wrongly typed or out-of-range values
 */
[[nodiscard]] auto parse_engine_config(const nlohmann::json &json) -> engine_config;

/**
 * @brief Reads a JSON configuration file.
 *
 * @throws std::runtime_error if the file cannot be read or is not valid JSON
 * @throws std::invalid_argument on wrongly typed or out-of-range values
 */
[[nodiscard]] auto load_engine_config(const std::filesystem::path &path) -> engine_config;

}// namespace vine_sync::config
