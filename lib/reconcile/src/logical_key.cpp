#include <reconcile/logical_key.hpp>

#include <fmt/format.h>

namespace vine_sync::reconcile {

auto logical_key(const nostr::protocol::event_data &event) -> std::optional<std::string>
{
  if (nostr::protocol::is_addressable(event.kind)) {
    if (event.pubkey.empty()) { return std::nullopt; }
    auto d_tag = event.first_tag_value("d");
    if (not d_tag) { return std::nullopt; }
    return make_address(event.kind, event.pubkey, *d_tag);
  }

  if (nostr::protocol::is_replaceable(event.kind)) {
    if (event.pubkey.empty()) { return std::nullopt; }
    return make_address(event.kind, event.pubkey, "");
  }

  if (event.id.empty()) { return std::nullopt; }
  return event.id;
}

auto make_address(std::uint32_t kind, const std::string &pubkey, const std::string &d_tag) -> std::string
{
  return fmt::format("{}:{}:{}", kind, pubkey, d_tag);
}

}// namespace vine_sync::reconcile
