#include <config/logging.hpp>

#include <fmt/format.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <stdexcept>
#include <vector>

namespace vine_sync::config {

auto parse_log_level(const std::string &name) -> spdlog::level::level_enum
{
  auto level = spdlog::level::from_str(name);
  // from_str maps unknown names to off
  if (level == spdlog::level::off and name != "off") {
    throw std::invalid_argument(fmt::format("Unknown log level '{}'", name));
  }
  return level;
}

auto configure_logging(const logging_config &config) -> void
{
  const auto level = parse_log_level(config.level);

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  if (config.file) {
    sinks.push_back(
      std::make_shared<spdlog::sinks::rotating_file_sink_mt>(*config.file, config.max_file_size, config.max_files));
  }

  auto logger = std::make_shared<spdlog::logger>("vine_sync", sinks.begin(), sinks.end());
  logger->set_level(level);
  spdlog::set_default_logger(logger);
  spdlog::set_level(level);
}

}// namespace vine_sync::config
