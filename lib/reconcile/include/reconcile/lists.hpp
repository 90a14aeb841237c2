#pragma once

#include <nostr/protocol.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace vine_sync::reconcile {

/// NIP-51 follow set (kind 30000)
struct follow_set
{
  std::string id;///< d tag
  std::string name;
  std::optional<std::string> description;
  std::optional<std::string> image_url;
  std::vector<std::string> pubkeys;
  std::string event_id;
  std::uint64_t created_at{};

  /**
   * @brief Reads a follow set from its event.
   *
   * @return Decoded set, or std::nullopt if the event is not a kind 30000 event with a d tag
   */
  static auto from_event(const nostr::protocol::event_data &event) -> std::optional<follow_set>;
};

/// NIP-51 curated video list (kind 30005)
struct curated_list
{
  std::string id;///< d tag
  std::string name;
  std::optional<std::string> description;
  std::optional<std::string> image_url;
  std::optional<std::string> thumbnail_event_id;
  std::string play_order{ "chronological" };
  std::vector<std::string> tags;///< Hashtags ("t")
  std::vector<std::string> video_event_ids;///< "e" tags in list order
  std::vector<std::string> video_addresses;///< "a" tags in list order
  bool is_collaborative{ false };
  std::vector<std::string> allowed_collaborators;
  std::string event_id;
  std::uint64_t created_at{};

  static auto from_event(const nostr::protocol::event_data &event) -> std::optional<curated_list>;
};

}// namespace vine_sync::reconcile
