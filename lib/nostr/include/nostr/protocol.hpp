#pragma once

#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace vine_sync::nostr::protocol {

/**
 * @brief Nostr event kinds the engine subscribes to and reconciles.
 */
enum class kind : std::uint32_t {
  profile_metadata = 0,///< User profile metadata (NIP-01)
  text_note = 1,///< Text note/comment (NIP-01)
  contact_list = 3,///< Contact list (NIP-02)
  deletion = 5,///< Deletion request (NIP-09)
  repost = 6,///< Repost of a kind 1 note (NIP-18)
  reaction = 7,///< Reaction / like (NIP-25)
  generic_repost = 16,///< Repost of any other kind (NIP-18)

  follow_set = 30000,///< Follow set (NIP-51)
  curation_set = 30005,///< Curated video list (NIP-51)
  addressable_short_video = 34236,///< Addressable short video (NIP-71)
};

/// Raw numeric value of a kind
[[nodiscard]] constexpr auto to_number(kind value) -> std::uint32_t { return static_cast<std::uint32_t>(value); }

/// Kinds where only the latest event per (kind, pubkey) is valid
[[nodiscard]] constexpr auto is_replaceable(std::uint32_t kind_value) -> bool
{
  constexpr std::uint32_t replaceable_start = 10000;
  constexpr std::uint32_t replaceable_end = 20000;
  return kind_value == to_number(kind::profile_metadata) or kind_value == to_number(kind::contact_list)
         or (kind_value >= replaceable_start and kind_value < replaceable_end);
}

/// Kinds where only the latest event per (kind, pubkey, d-tag) is valid
[[nodiscard]] constexpr auto is_addressable(std::uint32_t kind_value) -> bool
{
  constexpr std::uint32_t addressable_start = 30000;
  constexpr std::uint32_t addressable_end = 40000;
  return kind_value >= addressable_start and kind_value < addressable_end;
}

/**
 * @brief Nostr event record as delivered by a relay.
 *
 * The engine treats signature and id validation as the transport's job; only
 * the structural shape of the record is checked when decoding.
 */
struct event_data
{
  std::string id;///< Event ID (32-byte hex hash)
  std::string pubkey;///< Public key of event creator (32-byte hex)
  std::uint64_t created_at{};///< Unix timestamp in seconds
  std::uint32_t kind{};///< Event kind identifier
  std::vector<std::vector<std::string>> tags;///< Event tags (arbitrary string arrays)
  std::string content;///< Event content
  std::string sig;///< Schnorr signature (64-byte hex)

  /**
   * @brief Decodes an event from a parsed JSON object.
   *
   * @param json JSON object in NIP-01 event layout
   * @return Parsed event_data or std::nullopt if any field is missing or mistyped
   */
  static auto from_json(const nlohmann::json &json) -> std::optional<event_data>;

  /**
   * @brief Decodes an event from JSON text.
   *
   * @param json JSON string
   * @return Parsed event_data or std::nullopt on failure
   */
  static auto deserialize(const std::string &json) -> std::optional<event_data>;

  /**
   * @brief Encodes the event as a NIP-01 JSON object.
   */
  [[nodiscard]] auto to_json() const -> nlohmann::json;

  /**
   * @brief Returns the first value of the first tag with the given name.
   *
   * @param name Tag name, e.g. "d"
   * @return Tag value or std::nullopt when absent or valueless
   */
  [[nodiscard]] auto first_tag_value(std::string_view name) const -> std::optional<std::string>;

  /**
   * @brief Returns the first value of every tag with the given name, in tag order.
   */
  [[nodiscard]] auto tag_values(std::string_view name) const -> std::vector<std::string>;

  [[nodiscard]] auto is_kind(enum kind expected) const -> bool { return kind == to_number(expected); }

  auto operator==(const event_data &) const -> bool = default;
};

/**
 * @brief NIP-01 subscription filter.
 *
 * Unset optionals are omitted from the encoded filter. Tag filters are keyed by
 * the single-letter tag name without the leading '#'.
 */
struct filter
{
  std::optional<std::vector<std::string>> ids;
  std::optional<std::vector<std::string>> authors;
  std::optional<std::vector<std::uint32_t>> kinds;
  std::map<std::string, std::vector<std::string>> tags;
  std::optional<std::uint64_t> since;
  std::optional<std::uint64_t> until;
  std::optional<std::uint32_t> limit;

  [[nodiscard]] auto to_json() const -> nlohmann::json;

  static auto from_json(const nlohmann::json &json) -> std::optional<filter>;

  auto operator==(const filter &) const -> bool = default;
};

/**
 * @brief Client REQ frame.
 */
struct req
{
  std::string subscription_id;///< Relay-side stream identifier
  std::vector<filter> filters;///< Filters OR-ed together by the relay

  /**
   * @brief Serializes to ["REQ", subscription_id, filter...].
   */
  [[nodiscard]] auto serialize() const -> std::string;
};

/**
 * @brief Client CLOSE frame.
 */
struct close_request
{
  std::string subscription_id;

  /**
   * @brief Serializes to ["CLOSE", subscription_id].
   */
  [[nodiscard]] auto serialize() const -> std::string;
};

/// Relay EVENT frame
struct event
{
  std::string subscription_id;
  event_data data;
};

/// Relay End of Stored Events frame
struct eose
{
  std::string subscription_id;
};

/// Relay CLOSED frame; the relay terminated the stream
struct closed
{
  std::string subscription_id;
  std::string message;
};

/// Relay NOTICE frame
struct notice
{
  std::string message;
};

using relay_frame = std::variant<event, eose, closed, notice>;

/**
 * @brief Parses a relay-to-client frame.
 *
 * @param json Frame text
 * @return Decoded frame, or std::nullopt for malformed or unsupported frames
 */
auto parse_relay_frame(const std::string &json) -> std::optional<relay_frame>;

/// Maximum allowed subscription ID length
constexpr std::size_t max_subscription_id_length = 64;

/**
 * @brief Validates a subscription ID.
 *
 * @param subscription_id ID to validate
 * @throws std::invalid_argument if ID is empty or exceeds maximum length
 */
inline auto validate_subscription_id(const std::string &subscription_id) -> void
{
  if (subscription_id.empty()) { throw std::invalid_argument("Subscription ID cannot be empty"); }
  if (subscription_id.length() > max_subscription_id_length) {
    throw std::invalid_argument("Subscription ID exceeds maximum length of 64 characters");
  }
}

}// namespace vine_sync::nostr::protocol
