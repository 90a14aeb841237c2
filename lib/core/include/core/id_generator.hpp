#pragma once

#include <string>
#include <string_view>

namespace vine_sync::core {

/**
 * @brief Generates identifiers for subscriptions and relay streams.
 */
class id_generator
{
public:
  /**
   * @brief Generates a random 32 character hex identifier.
   *
   * Fits the 64 character limit relays impose on subscription ids.
   *
   * @return Lowercase hex string without separators
   */
  [[nodiscard]] static auto random_hex() -> std::string;

  /**
   * @brief Generates a managed subscription id for a logical name.
   *
   * @param name Logical subscription name
   * @return Identifier of the form "<name>_<random hex>", unique per call
   */
  [[nodiscard]] static auto subscription_id(std::string_view name) -> std::string;
};

}// namespace vine_sync::core
