#include <storage/file_store.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>

namespace vine_sync::storage {

file_store::file_store(std::filesystem::path directory) : directory_(std::move(directory)) {}

auto file_store::is_valid_key(const std::string &key) -> bool
{
  if (key.empty() or key.starts_with('.')) { return false; }
  return std::ranges::all_of(key, [](const char character) {
    return (character >= 'a' and character <= 'z') or (character >= 'A' and character <= 'Z')
           or (character >= '0' and character <= '9') or character == '.' or character == '_' or character == '-';
  });
}

auto file_store::path_for(const std::string &key) const -> std::filesystem::path { return directory_ / key; }

auto file_store::get(const std::string &key) -> std::optional<std::string>
{
  if (not is_valid_key(key)) { return std::nullopt; }

  const std::scoped_lock lock(mutex_);
  std::ifstream file(path_for(key), std::ios::binary);
  if (not file) { return std::nullopt; }

  std::string contents{ std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>() };
  if (file.bad()) {
    spdlog::warn("[file_store] Failed to read {}", path_for(key).string());
    return std::nullopt;
  }
  return contents;
}

auto file_store::put(const std::string &key, const std::string &value) -> bool
{
  if (not is_valid_key(key)) {
    spdlog::warn("[file_store] Rejecting invalid key: {}", key);
    return false;
  }

  const std::scoped_lock lock(mutex_);
  std::error_code error;
  std::filesystem::create_directories(directory_, error);
  if (error) {
    spdlog::error("[file_store] Cannot create {}: {}", directory_.string(), error.message());
    return false;
  }

  const auto target = path_for(key);
  auto temp = target;
  temp += ".tmp";

  {
    std::ofstream file(temp, std::ios::binary | std::ios::trunc);
    if (not file) {
      spdlog::error("[file_store] Cannot open {}", temp.string());
      return false;
    }
    file.write(value.data(), static_cast<std::streamsize>(value.size()));
    file.flush();
    if (not file) {
      spdlog::error("[file_store] Failed to write {}", temp.string());
      std::filesystem::remove(temp, error);
      return false;
    }
  }

  std::filesystem::rename(temp, target, error);
  if (error) {
    spdlog::error("[file_store] Cannot rename {} to {}: {}", temp.string(), target.string(), error.message());
    std::filesystem::remove(temp, error);
    return false;
  }
  return true;
}

auto file_store::erase(const std::string &key) -> bool
{
  if (not is_valid_key(key)) { return false; }

  const std::scoped_lock lock(mutex_);
  std::error_code error;
  const auto removed = std::filesystem::remove(path_for(key), error);
  if (error) {
    spdlog::warn("[file_store] Cannot remove {}: {}", path_for(key).string(), error.message());
    return false;
  }
  return removed;
}

}// namespace vine_sync::storage
