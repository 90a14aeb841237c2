#pragma once

#include <nostr/protocol.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace vine_sync_test {

using vine_sync::nostr::protocol::event_data;
using vine_sync::nostr::protocol::kind;
using vine_sync::nostr::protocol::to_number;

inline auto make_reaction(const std::string &id,
  const std::string &pubkey,
  const std::string &target,
  std::uint64_t created_at,
  const std::string &content = "+") -> event_data
{
  return event_data{ .id = id,
    .pubkey = pubkey,
    .created_at = created_at,
    .kind = to_number(kind::reaction),
    .tags = { { "e", target }, { "p", "target_author" } },
    .content = content,
    .sig = "sig" };
}

inline auto make_repost(const std::string &id,
  const std::string &pubkey,
  const std::string &target_address,
  std::uint64_t created_at) -> event_data
{
  return event_data{ .id = id,
    .pubkey = pubkey,
    .created_at = created_at,
    .kind = to_number(kind::generic_repost),
    .tags = { { "a", target_address }, { "k", "34236" } },
    .content = "",
    .sig = "sig" };
}

inline auto make_contact_list(const std::string &id,
  const std::string &pubkey,
  std::uint64_t created_at,
  const std::vector<std::string> &follows) -> event_data
{
  event_data event{ .id = id,
    .pubkey = pubkey,
    .created_at = created_at,
    .kind = to_number(kind::contact_list),
    .tags = {},
    .content = "",
    .sig = "sig" };
  for (const auto &followed : follows) { event.tags.push_back({ "p", followed }); }
  return event;
}

inline auto make_follow_set(const std::string &id,
  const std::string &pubkey,
  const std::string &d_tag,
  std::uint64_t created_at,
  const std::vector<std::string> &members,
  const std::string &title = "") -> event_data
{
  event_data event{ .id = id,
    .pubkey = pubkey,
    .created_at = created_at,
    .kind = to_number(kind::follow_set),
    .tags = { { "d", d_tag } },
    .content = "",
    .sig = "sig" };
  if (not title.empty()) { event.tags.push_back({ "title", title }); }
  for (const auto &member : members) { event.tags.push_back({ "p", member }); }
  return event;
}

inline auto make_curation_set(const std::string &id,
  const std::string &pubkey,
  const std::string &d_tag,
  std::uint64_t created_at,
  const std::vector<std::string> &video_ids,
  const std::string &title = "") -> event_data
{
  event_data event{ .id = id,
    .pubkey = pubkey,
    .created_at = created_at,
    .kind = to_number(kind::curation_set),
    .tags = { { "d", d_tag } },
    .content = "",
    .sig = "sig" };
  if (not title.empty()) { event.tags.push_back({ "title", title }); }
  for (const auto &video_id : video_ids) { event.tags.push_back({ "e", video_id }); }
  return event;
}

inline auto make_deletion(const std::string &id,
  const std::string &pubkey,
  std::uint64_t created_at,
  const std::vector<std::string> &event_ids,
  const std::vector<std::string> &addresses = {}) -> event_data
{
  event_data event{ .id = id,
    .pubkey = pubkey,
    .created_at = created_at,
    .kind = to_number(kind::deletion),
    .tags = {},
    .content = "",
    .sig = "sig" };
  for (const auto &event_id : event_ids) { event.tags.push_back({ "e", event_id }); }
  for (const auto &address : addresses) { event.tags.push_back({ "a", address }); }
  return event;
}

}// namespace vine_sync_test
