#pragma once

#include <config/engine_config.hpp>

#include <spdlog/common.h>

#include <string>

namespace vine_sync::config {

/**
 * @brief Parses a level name.
 *
 * @throws std::invalid_argument for unknown names
 */
[[nodiscard]] auto parse_log_level(const std::string &name) -> spdlog::level::level_enum;

/**
 * @brief Installs the default logger: console, plus a rotating file when configured.
 */
auto configure_logging(const logging_config &config) -> void;

}// namespace vine_sync::config
