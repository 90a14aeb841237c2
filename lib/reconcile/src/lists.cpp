#include <reconcile/lists.hpp>

namespace vine_sync::reconcile {

namespace {

  /// Title tag, else first line of the content, else the fallback.
  auto list_name(const nostr::protocol::event_data &event, const std::string &fallback) -> std::string
  {
    if (auto title = event.first_tag_value("title")) { return *title; }
    auto first_line = event.content.substr(0, event.content.find('\n'));
    return first_line.empty() ? fallback : first_line;
  }

}// namespace

auto follow_set::from_event(const nostr::protocol::event_data &event) -> std::optional<follow_set>
{
  if (not event.is_kind(nostr::protocol::kind::follow_set)) { return std::nullopt; }
  auto d_tag = event.first_tag_value("d");
  if (not d_tag) { return std::nullopt; }

  return follow_set{ .id = *d_tag,
    .name = list_name(event, "Untitled Set"),
    .description = event.first_tag_value("description"),
    .image_url = event.first_tag_value("image"),
    .pubkeys = event.tag_values("p"),
    .event_id = event.id,
    .created_at = event.created_at };
}

auto curated_list::from_event(const nostr::protocol::event_data &event) -> std::optional<curated_list>
{
  if (not event.is_kind(nostr::protocol::kind::curation_set)) { return std::nullopt; }
  auto d_tag = event.first_tag_value("d");
  if (not d_tag) { return std::nullopt; }

  curated_list list{ .id = *d_tag,
    .name = list_name(event, "Untitled List"),
    .description = event.first_tag_value("description"),
    .image_url = event.first_tag_value("image"),
    .thumbnail_event_id = event.first_tag_value("thumbnail"),
    .tags = event.tag_values("t"),
    .video_event_ids = event.tag_values("e"),
    .video_addresses = event.tag_values("a"),
    .allowed_collaborators = event.tag_values("collaborator"),
    .event_id = event.id,
    .created_at = event.created_at };

  if (auto play_order = event.first_tag_value("playorder")) { list.play_order = *play_order; }
  list.is_collaborative = event.first_tag_value("collaborative") == "true";
  if (not list.description and not event.content.empty()) { list.description = event.content; }

  return list;
}

}// namespace vine_sync::reconcile
