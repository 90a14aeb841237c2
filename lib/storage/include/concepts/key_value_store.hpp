#pragma once

#include <concepts>
#include <optional>
#include <string>

namespace vine_sync::concepts {

/**
 * @brief Concept for the durable key-value collaborator behind the local cache.
 *
 * Failures are reported as std::nullopt / false; implementations do not throw.
 */
template<typename T>
concept key_value_store = requires(T &store, const std::string &key, const std::string &value) {
  { store.get(key) } -> std::same_as<std::optional<std::string>>;
  { store.put(key, value) } -> std::same_as<bool>;
  { store.erase(key) } -> std::same_as<bool>;
};

}// namespace vine_sync::concepts
