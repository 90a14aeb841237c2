#include <storage/cache_codec.hpp>

#include <reconcile/logical_key.hpp>

#include <nlohmann/json.hpp>

namespace vine_sync::storage {

namespace {

  auto decode_record(reconcile::collection which, const nlohmann::json &record)
    -> std::optional<reconcile::reconciled_item>
  {
    if (not record.is_object()) { return std::nullopt; }

    auto key_it = record.find("key");
    auto event_it = record.find("event");
    if (key_it == record.end() or not key_it->is_string() or event_it == record.end()) { return std::nullopt; }

    auto event = nostr::protocol::event_data::from_json(*event_it);
    if (not event) { return std::nullopt; }
    if (reconcile::collection_for(event->kind) != which) { return std::nullopt; }

    auto key = reconcile::logical_key(*event);
    if (not key or *key != key_it->get<std::string>()) { return std::nullopt; }

    bool local_only = false;
    if (auto flag_it = record.find("local_only"); flag_it != record.end()) {
      if (not flag_it->is_boolean()) { return std::nullopt; }
      local_only = flag_it->get<bool>();
    }

    return reconcile::reconciled_item{ .key = std::move(*key), .event = std::move(*event), .local_only = local_only };
  }

}// namespace

auto encode_collection(const std::vector<reconcile::reconciled_item> &items) -> std::string
{
  nlohmann::json records = nlohmann::json::array();
  for (const auto &item : items) {
    records.push_back({ { "key", item.key }, { "local_only", item.local_only }, { "event", item.event.to_json() } });
  }

  const nlohmann::json blob = { { "version", cache_format_version }, { "items", std::move(records) } };
  return blob.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

auto decode_collection(reconcile::collection which, const std::string &blob) -> std::optional<decoded_collection>
{
  auto parsed = nlohmann::json::parse(blob, nullptr, false);
  if (parsed.is_discarded() or not parsed.is_object()) { return std::nullopt; }

  auto version_it = parsed.find("version");
  if (version_it == parsed.end() or not version_it->is_number_integer()
      or version_it->get<int>() != cache_format_version) {
    return std::nullopt;
  }

  auto items_it = parsed.find("items");
  if (items_it == parsed.end() or not items_it->is_array()) { return std::nullopt; }

  decoded_collection decoded;
  for (const auto &record : *items_it) {
    if (auto item = decode_record(which, record)) {
      decoded.items.push_back(std::move(*item));
    } else {
      ++decoded.corrupt;
    }
  }
  return decoded;
}

}// namespace vine_sync::storage
