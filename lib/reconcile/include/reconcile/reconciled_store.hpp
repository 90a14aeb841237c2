#pragma once

#include <nostr/protocol.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace vine_sync::reconcile {

/// Where an item entered the engine from
enum class item_origin : std::uint8_t {
  live,///< Delivered by a relay subscription this session
  cache,///< Restored from the local cache
  local,///< Created on this device and not yet seen from a relay
};

/**
 * @brief One reconciled record.
 */
struct reconciled_item
{
  std::string key;///< Event id, or kind:pubkey:d-tag for replaceable/addressable kinds
  nostr::protocol::event_data event;///< Payload
  bool local_only{ false };

  [[nodiscard]] auto created_at() const -> std::uint64_t { return event.created_at; }

  auto operator==(const reconciled_item &) const -> bool = default;
};

/// Result of merging one item
enum class merge_outcome : std::uint8_t {
  inserted,///< No entry existed for the key
  replaced,///< Incoming item was strictly newer
  confirmed,///< Relay copy of an item that was local-only
  duplicate,///< Same event already present
  stale,///< Existing entry is newer or equally new
};

/**
 * @brief Last-writer-wins map from logical key to item.
 *
 * For each key only the item with the greatest created_at is kept. On equal
 * timestamps the item already present wins. Not thread-safe.
 */
class reconciled_store
{
public:
  /**
   * @brief Merges an item under its key.
   */
  auto merge(reconciled_item item) -> merge_outcome;

  /**
   * @brief Removes the entry for a key.
   *
   * @return true if an entry was removed
   */
  auto erase(const std::string &key) -> bool;

  [[nodiscard]] auto find(const std::string &key) const -> const reconciled_item *;

  [[nodiscard]] auto contains(const std::string &key) const -> bool { return items_.contains(key); }

  [[nodiscard]] auto size() const -> std::size_t { return items_.size(); }

  [[nodiscard]] auto empty() const -> bool { return items_.empty(); }

  /// Copy of every item, ordered by key
  [[nodiscard]] auto snapshot() const -> std::vector<reconciled_item>;

  [[nodiscard]] auto items() const -> const std::unordered_map<std::string, reconciled_item> & { return items_; }

  auto clear() -> void { items_.clear(); }

private:
  std::unordered_map<std::string, reconciled_item> items_;
};

}// namespace vine_sync::reconcile
