#include <config/engine_config.hpp>
#include <config/logging.hpp>
#include <platform/env_utils.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <tuple>

namespace vine_sync::config {

namespace {

  auto require_object(const nlohmann::json &json, const std::string &section) -> void
  {
    if (not json.is_object()) { throw std::invalid_argument(fmt::format("'{}' must be an object", section)); }
  }

  auto read_count(const nlohmann::json &section, const char *key, std::size_t fallback, bool allow_zero = false)
    -> std::size_t
  {
    auto iter = section.find(key);
    if (iter == section.end()) { return fallback; }
    if (not iter->is_number_unsigned() or (not allow_zero and iter->get<std::uint64_t>() == 0)) {
      throw std::invalid_argument(fmt::format("'{}' must be a positive integer", key));
    }
    return iter->get<std::size_t>();
  }

  auto read_seconds(const nlohmann::json &section, const char *key, std::chrono::milliseconds fallback)
    -> std::chrono::milliseconds
  {
    auto iter = section.find(key);
    if (iter == section.end()) { return fallback; }
    // One year caps every configurable duration well inside the millisecond range.
    constexpr double max_seconds = 365.0 * 24.0 * 60.0 * 60.0;
    if (not iter->is_number() or not (iter->get<double>() > 0.0) or iter->get<double>() > max_seconds) {
      throw std::invalid_argument(fmt::format("'{}' must be a positive number of seconds up to one year", key));
    }
    return std::chrono::milliseconds(static_cast<std::int64_t>(iter->get<double>() * 1000.0));
  }

  auto read_string(const nlohmann::json &section, const char *key) -> std::optional<std::string>
  {
    auto iter = section.find(key);
    if (iter == section.end() or iter->is_null()) { return std::nullopt; }
    if (not iter->is_string()) { throw std::invalid_argument(fmt::format("'{}' must be a string", key)); }
    return iter->get<std::string>();
  }

  auto parse_subscriptions(const nlohmann::json &json, subscription::subscription_config &config) -> void
  {
    require_object(json, "subscriptions");

    config.max_concurrent_subscriptions =
      read_count(json, "max_concurrent_subscriptions", config.max_concurrent_subscriptions);
    config.max_events_per_minute = read_count(json, "max_events_per_minute", config.max_events_per_minute);
    config.default_timeout = read_seconds(json, "default_timeout_seconds", config.default_timeout);
    config.retry_delay = read_seconds(json, "retry_delay_seconds", config.retry_delay);

    if (auto iter = json.find("max_retry_attempts"); iter != json.end()) {
      if (iter->is_null()) {
        config.max_retry_attempts.reset();
      } else {
        config.max_retry_attempts = read_count(json, "max_retry_attempts", 0, true);
      }
    }

    const auto limit = read_count(json, "max_filter_limit", config.max_filter_limit);
    if (limit > UINT32_MAX) { throw std::invalid_argument("'max_filter_limit' is out of range"); }
    config.max_filter_limit = static_cast<std::uint32_t>(limit);
  }

  auto parse_cache(const nlohmann::json &json, cache_config &config) -> void
  {
    require_object(json, "cache");

    if (auto directory = read_string(json, "directory")) {
      if (directory->empty()) { throw std::invalid_argument("'directory' must not be empty"); }
      config.directory = platform::expand_tilde_path(*directory);
    }
    if (auto key_namespace = read_string(json, "namespace")) {
      if (key_namespace->empty()) { throw std::invalid_argument("'namespace' must not be empty"); }
      config.key_namespace = *key_namespace;
    }
    if (auto iter = json.find("corruption_threshold"); iter != json.end()) {
      if (not iter->is_number() or iter->get<double>() < 0.0 or iter->get<double>() > 1.0) {
        throw std::invalid_argument("'corruption_threshold' must be within [0, 1]");
      }
      config.corruption_threshold = iter->get<double>();
    }
  }

  auto parse_logging(const nlohmann::json &json, logging_config &config) -> void
  {
    require_object(json, "logging");

    if (auto level = read_string(json, "level")) {
      std::ignore = parse_log_level(*level);
      config.level = *level;
    }
    if (auto file = read_string(json, "file")) { config.file = platform::expand_tilde_path(*file); }
    config.max_file_size = read_count(json, "max_file_size", config.max_file_size);
    config.max_files = read_count(json, "max_files", config.max_files);
  }

}// namespace

auto engine_config::engine_options() const -> engine::sync_engine_options
{
  return engine::sync_engine_options{
    .subscriptions = subscriptions,
    .cache_namespace = cache.key_namespace,
    .corruption_threshold = cache.corruption_threshold,
    .queue_capacity = queue_capacity,
    .max_batch_size = max_batch_size,
  };
}

auto default_engine_config() -> engine_config
{
  engine_config config;
  config.cache.directory = platform::default_cache_directory();
  return config;
}

auto parse_engine_config(const nlohmann::json &json) -> engine_config
{
  require_object(json, "configuration");

  auto config = default_engine_config();

  for (const auto &[key, value] : json.items()) {
    if (key == "subscriptions") {
      parse_subscriptions(value, config.subscriptions);
    } else if (key == "cache") {
      parse_cache(value, config.cache);
    } else if (key == "logging") {
      parse_logging(value, config.logging);
    } else if (key == "engine") {
      require_object(value, "engine");
      config.queue_capacity = read_count(value, "queue_capacity", config.queue_capacity);
      config.max_batch_size = read_count(value, "max_batch_size", config.max_batch_size);
    } else {
      spdlog::warn("[config] Ignoring unknown section '{}'", key);
    }
  }

  return config;
}

auto load_engine_config(const std::filesystem::path &path) -> engine_config
{
  std::ifstream file(path);
  if (not file) { throw std::runtime_error(fmt::format("Cannot open configuration file {}", path.string())); }

  auto json = nlohmann::json::parse(file, nullptr, false);
  if (json.is_discarded()) {
    throw std::runtime_error(fmt::format("Configuration file {} is not valid JSON", path.string()));
  }

  spdlog::info("[config] Loaded configuration from {}", path.string());
  return parse_engine_config(json);
}

}// namespace vine_sync::config
