#include <nostr/protocol.hpp>

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <limits>

namespace vine_sync::nostr::protocol {

namespace {

  auto read_string_array(const nlohmann::json &json) -> std::optional<std::vector<std::string>>
  {
    if (not json.is_array()) { return std::nullopt; }
    std::vector<std::string> values;
    values.reserve(json.size());
    for (const auto &element : json) {
      if (not element.is_string()) { return std::nullopt; }
      values.push_back(element.get<std::string>());
    }
    return values;
  }

  /// Unsigned JSON number that fits 32 bits
  auto read_uint32(const nlohmann::json &json) -> std::optional<std::uint32_t>
  {
    if (not json.is_number_unsigned()) { return std::nullopt; }
    const auto value = json.get<std::uint64_t>();
    if (value > std::numeric_limits<std::uint32_t>::max()) { return std::nullopt; }
    return static_cast<std::uint32_t>(value);
  }

}// namespace

auto event_data::from_json(const nlohmann::json &json) -> std::optional<event_data>
{
  try {
    if (not json.is_object()) { return std::nullopt; }

    event_data event;

    if (not json.contains("id") or not json["id"].is_string()) { return std::nullopt; }
    event.id = json["id"].get<std::string>();

    if (not json.contains("pubkey") or not json["pubkey"].is_string()) { return std::nullopt; }
    event.pubkey = json["pubkey"].get<std::string>();

    if (not json.contains("created_at") or not json["created_at"].is_number_unsigned()) { return std::nullopt; }
    event.created_at = json["created_at"].get<std::uint64_t>();

    if (not json.contains("kind")) { return std::nullopt; }
    auto kind_value = read_uint32(json["kind"]);
    if (not kind_value) { return std::nullopt; }
    event.kind = *kind_value;

    if (not json.contains("content") or not json["content"].is_string()) { return std::nullopt; }
    event.content = json["content"].get<std::string>();

    if (json.contains("sig")) {
      if (not json["sig"].is_string()) { return std::nullopt; }
      event.sig = json["sig"].get<std::string>();
    }

    if (json.contains("tags")) {
      if (not json["tags"].is_array()) { return std::nullopt; }
      for (const auto &tag_json : json["tags"]) {
        auto tag = read_string_array(tag_json);
        if (not tag) { return std::nullopt; }
        event.tags.push_back(std::move(*tag));
      }
    }

    return event;
  } catch (const nlohmann::json::exception &) {
    return std::nullopt;
  }
}

auto event_data::deserialize(const std::string &json) -> std::optional<event_data>
{
  auto parsed = nlohmann::json::parse(json, nullptr, false);
  if (parsed.is_discarded()) { return std::nullopt; }
  return from_json(parsed);
}

auto event_data::to_json() const -> nlohmann::json
{
  nlohmann::json json_obj;

  json_obj["id"] = id;
  json_obj["pubkey"] = pubkey;
  json_obj["created_at"] = created_at;
  json_obj["kind"] = kind;
  json_obj["content"] = content;
  json_obj["sig"] = sig;

  json_obj["tags"] = nlohmann::json::array();
  for (const auto &tag : tags) {
    nlohmann::json tag_json = nlohmann::json::array();
    std::ranges::copy(tag, std::back_inserter(tag_json));
    json_obj["tags"].push_back(tag_json);
  }

  return json_obj;
}

auto event_data::first_tag_value(std::string_view name) const -> std::optional<std::string>
{
  auto iter = std::ranges::find_if(tags, [name](const auto &tag) { return tag.size() > 1 and tag[0] == name; });
  if (iter == tags.end()) { return std::nullopt; }
  return (*iter)[1];
}

auto event_data::tag_values(std::string_view name) const -> std::vector<std::string>
{
  std::vector<std::string> values;
  for (const auto &tag : tags) {
    if (tag.size() > 1 and tag[0] == name) { values.push_back(tag[1]); }
  }
  return values;
}

auto filter::to_json() const -> nlohmann::json
{
  nlohmann::json json_obj = nlohmann::json::object();

  if (ids) { json_obj["ids"] = *ids; }
  if (authors) { json_obj["authors"] = *authors; }
  if (kinds) { json_obj["kinds"] = *kinds; }
  for (const auto &[name, values] : tags) { json_obj["#" + name] = values; }
  if (since) { json_obj["since"] = *since; }
  if (until) { json_obj["until"] = *until; }
  if (limit) { json_obj["limit"] = *limit; }

  return json_obj;
}

auto filter::from_json(const nlohmann::json &json) -> std::optional<filter>
{
  if (not json.is_object()) { return std::nullopt; }

  try {
    filter result;
    for (const auto &[key, value] : json.items()) {
      if (key == "ids" or key == "authors") {
        auto values = read_string_array(value);
        if (not values) { return std::nullopt; }
        (key == "ids" ? result.ids : result.authors) = std::move(*values);
      } else if (key == "kinds") {
        if (not value.is_array()) { return std::nullopt; }
        std::vector<std::uint32_t> kinds;
        for (const auto &element : value) {
          auto kind_value = read_uint32(element);
          if (not kind_value) { return std::nullopt; }
          kinds.push_back(*kind_value);
        }
        result.kinds = std::move(kinds);
      } else if (key.size() == 2 and key[0] == '#') {
        auto values = read_string_array(value);
        if (not values) { return std::nullopt; }
        result.tags[key.substr(1)] = std::move(*values);
      } else if (key == "since" or key == "until" or key == "limit") {
        if (not value.is_number_unsigned()) { return std::nullopt; }
        if (key == "since") {
          result.since = value.get<std::uint64_t>();
        } else if (key == "until") {
          result.until = value.get<std::uint64_t>();
        } else {
          auto limit = read_uint32(value);
          if (not limit) { return std::nullopt; }
          result.limit = *limit;
        }
      } else {
        return std::nullopt;
      }
    }
    return result;
  } catch (const nlohmann::json::exception &) {
    return std::nullopt;
  }
}

auto req::serialize() const -> std::string
{
  nlohmann::json frame = nlohmann::json::array({ "REQ", subscription_id });
  for (const auto &item : filters) { frame.push_back(item.to_json()); }
  return frame.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

auto close_request::serialize() const -> std::string
{
  return nlohmann::json::array({ "CLOSE", subscription_id }).dump();
}

auto parse_relay_frame(const std::string &json) -> std::optional<relay_frame>
{
  auto parsed = nlohmann::json::parse(json, nullptr, false);
  if (parsed.is_discarded() or not parsed.is_array() or parsed.empty() or not parsed[0].is_string()) {
    return std::nullopt;
  }

  const auto msg_type = parsed[0].get<std::string>();

  if (msg_type == "EVENT") {
    if (parsed.size() < 3 or not parsed[1].is_string()) { return std::nullopt; }
    auto data = event_data::from_json(parsed[2]);
    if (not data) { return std::nullopt; }
    return event{ .subscription_id = parsed[1].get<std::string>(), .data = std::move(*data) };
  }

  if (msg_type == "EOSE") {
    if (parsed.size() < 2 or not parsed[1].is_string()) { return std::nullopt; }
    return eose{ .subscription_id = parsed[1].get<std::string>() };
  }

  if (msg_type == "CLOSED") {
    if (parsed.size() < 2 or not parsed[1].is_string()) { return std::nullopt; }
    std::string message;
    if (parsed.size() > 2 and parsed[2].is_string()) { message = parsed[2].get<std::string>(); }
    return closed{ .subscription_id = parsed[1].get<std::string>(), .message = std::move(message) };
  }

  if (msg_type == "NOTICE") {
    if (parsed.size() < 2 or not parsed[1].is_string()) { return std::nullopt; }
    return notice{ .message = parsed[1].get<std::string>() };
  }

  return std::nullopt;
}

}// namespace vine_sync::nostr::protocol
