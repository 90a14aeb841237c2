#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

namespace vine_sync::storage {

/**
 * @brief Key-value store keeping one file per key under a directory.
 *
 * Writes go to a temporary file that is renamed over the target, so a reader
 * sees either the previous value or the new one. Keys are restricted to
 * [A-Za-z0-9._-]; other keys are rejected.
 */
class file_store
{
public:
  explicit file_store(std::filesystem::path directory);

  [[nodiscard]] auto get(const std::string &key) -> std::optional<std::string>;

  [[nodiscard]] auto put(const std::string &key, const std::string &value) -> bool;

  auto erase(const std::string &key) -> bool;

  [[nodiscard]] auto directory() const -> const std::filesystem::path & { return directory_; }

  [[nodiscard]] static auto is_valid_key(const std::string &key) -> bool;

private:
  [[nodiscard]] auto path_for(const std::string &key) const -> std::filesystem::path;

  std::filesystem::path directory_;
  std::mutex mutex_;
};

}// namespace vine_sync::storage
