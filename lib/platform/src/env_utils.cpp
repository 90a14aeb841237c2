#include <platform/env_utils.hpp>

#include <cstdlib>
#include <filesystem>
#include <mutex>
#include <system_error>

#ifdef _WIN32
#include <memory>
#endif

namespace vine_sync::platform {

auto get_env(const std::string &name) -> std::optional<std::string>
{
#ifdef _WIN32
  char *value_raw = nullptr;
  size_t len = 0;
  if (_dupenv_s(&value_raw, &len, name.c_str()) == 0 and value_raw != nullptr) {
    const std::unique_ptr<char, decltype(&free)> value(value_raw, &free);
    if (*value == '\0') { return std::nullopt; }
    return std::string(value.get());
  }
  return std::nullopt;
#else
  static std::mutex env_mutex;
  const std::scoped_lock lock(env_mutex);

  const char *value = std::getenv(name.c_str());// NOLINT(concurrency-mt-unsafe)
  if (value == nullptr or *value == '\0') { return std::nullopt; }
  return std::string(value);
#endif
}

auto get_home_directory() -> std::string
{
#ifdef _WIN32
  return get_env("USERPROFILE").value_or("");
#else
  return get_env("HOME").value_or("");
#endif
}

auto expand_tilde_path(const std::string &path) -> std::string
{
  if (path != "~" and not path.starts_with("~/")) { return path; }

  auto home = get_home_directory();
  if (home.empty()) { return path; }

  return home + path.substr(1);
}

auto default_cache_directory() -> std::string
{
#ifdef _WIN32
  if (auto local = get_env("LOCALAPPDATA")) { return (std::filesystem::path(*local) / "vine_sync").string(); }
#else
  if (auto xdg = get_env("XDG_CACHE_HOME")) { return (std::filesystem::path(*xdg) / "vine_sync").string(); }
#endif
  auto home = get_home_directory();
  if (home.empty()) {
    std::error_code error;
    auto temp = std::filesystem::temp_directory_path(error);
    return error ? std::string("vine_sync") : (temp / "vine_sync").string();
  }
  return (std::filesystem::path(home) / ".cache" / "vine_sync").string();
}

}// namespace vine_sync::platform
