#pragma once

#include <concepts/key_value_store.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <string>

namespace vine_sync_test {

/**
 * @brief In-memory key-value store with injectable write failures.
 */
class TestDoubleKeyValueStore
{
public:
  std::map<std::string, std::string> data;
  bool fail_writes = false;
  std::size_t put_count = 0;
  std::size_t erase_count = 0;

  auto get(const std::string &key) -> std::optional<std::string>
  {
    auto iter = data.find(key);
    if (iter == data.end()) { return std::nullopt; }
    return iter->second;
  }

  auto put(const std::string &key, const std::string &value) -> bool
  {
    if (fail_writes) { return false; }
    ++put_count;
    data[key] = value;
    return true;
  }

  auto erase(const std::string &key) -> bool
  {
    ++erase_count;
    return data.erase(key) > 0;
  }
};

static_assert(vine_sync::concepts::key_value_store<TestDoubleKeyValueStore>);

}// namespace vine_sync_test
