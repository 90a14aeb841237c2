#pragma once

#include <nostr/protocol.hpp>
#include <optional>
#include <string>

namespace vine_sync::reconcile {

/**
 * @brief Computes the key under which an event is reconciled.
 *
 * Addressable kinds key on "kind:pubkey:d-tag", replaceable kinds on
 * "kind:pubkey:", every other kind on its event id.
 *
 * @return Key, or std::nullopt for a malformed event (addressable without a
 *         d tag, missing pubkey, or missing id)
 */
[[nodiscard]] auto logical_key(const nostr::protocol::event_data &event) -> std::optional<std::string>;

/**
 * @brief Formats an address as used in "a" tags.
 */
[[nodiscard]] auto make_address(std::uint32_t kind, const std::string &pubkey, const std::string &d_tag)
  -> std::string;

}// namespace vine_sync::reconcile
