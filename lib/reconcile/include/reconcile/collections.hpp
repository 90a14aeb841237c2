#pragma once

#include <array>
#include <cstdint>
#include <nostr/protocol.hpp>
#include <optional>
#include <string_view>

namespace vine_sync::reconcile {

/**
 * @brief Logical collections of reconciled state, persisted one blob each.
 */
enum class collection : std::uint8_t {
  reactions,///< Kind 7
  reposts,///< Kinds 6 and 16
  contact_lists,///< Kind 3
  follow_sets,///< Kind 30000
  curation_sets,///< Kind 30005
  deletions,///< Kind 5
};

/// Deletions first so tombstones are in place before the items they remove are restored.
inline constexpr std::array<collection, 6> all_collections{ collection::deletions,
  collection::reactions,
  collection::reposts,
  collection::contact_lists,
  collection::follow_sets,
  collection::curation_sets };

[[nodiscard]] constexpr auto to_string(collection value) -> std::string_view
{
  switch (value) {
  case collection::reactions:
    return "reactions";
  case collection::reposts:
    return "reposts";
  case collection::contact_lists:
    return "contact_lists";
  case collection::follow_sets:
    return "follow_sets";
  case collection::curation_sets:
    return "curation_sets";
  case collection::deletions:
    return "deletions";
  }
  return "unknown";
}

/**
 * @brief Maps an event kind to the collection that reconciles it.
 *
 * @return Collection, or std::nullopt for kinds the engine does not track
 */
[[nodiscard]] constexpr auto collection_for(std::uint32_t kind_value) -> std::optional<collection>
{
  using nostr::protocol::kind;
  using nostr::protocol::to_number;

  if (kind_value == to_number(kind::reaction)) { return collection::reactions; }
  if (kind_value == to_number(kind::repost) or kind_value == to_number(kind::generic_repost)) {
    return collection::reposts;
  }
  if (kind_value == to_number(kind::contact_list)) { return collection::contact_lists; }
  if (kind_value == to_number(kind::follow_set)) { return collection::follow_sets; }
  if (kind_value == to_number(kind::curation_set)) { return collection::curation_sets; }
  if (kind_value == to_number(kind::deletion)) { return collection::deletions; }
  return std::nullopt;
}

}// namespace vine_sync::reconcile
