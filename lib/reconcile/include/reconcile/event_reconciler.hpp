#pragma once

#include <nostr/protocol.hpp>
#include <reconcile/collections.hpp>
#include <reconcile/lists.hpp>
#include <reconcile/reconciled_store.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace vine_sync::reconcile {

/// Result of reconciling one event
enum class reconcile_outcome : std::uint8_t {
  inserted,
  replaced,
  confirmed,
  duplicate,
  stale,
  deleted,///< Blocked by an earlier deletion request
  malformed,///< Missing a required tag or field; discarded
  ignored,///< Kind not tracked by the engine
};

[[nodiscard]] auto to_string(reconcile_outcome outcome) -> std::string_view;

/// Whether an outcome changed local state
[[nodiscard]] constexpr auto is_mutation(reconcile_outcome outcome) -> bool
{
  return outcome == reconcile_outcome::inserted or outcome == reconcile_outcome::replaced
         or outcome == reconcile_outcome::confirmed;
}

/// Aggregate result of a batch
struct batch_result
{
  std::map<reconcile_outcome, std::size_t> counts;
  std::set<collection> mutated;

  [[nodiscard]] auto count(reconcile_outcome outcome) const -> std::size_t
  {
    auto iter = counts.find(outcome);
    return iter == counts.end() ? 0 : iter->second;
  }
};

/**
 * @brief Reconciles inbound events into per-collection last-writer-wins state.
 *
 * Live events, cache-restored items and local writes all pass through the same
 * timestamp comparison under one mutex, so a restored item can never replace a
 * newer item seen earlier in the session. Deletion requests (kind 5) remove the
 * referenced reactions/reposts/lists of the same author and block later copies.
 *
 * After every batch that changed state the persist hook receives a snapshot of
 * each changed collection. The hook runs outside the reconciler lock, one call
 * at a time; a snapshot older than one already written is skipped, and an
 * exception thrown by the hook is logged and never reaches the caller.
 */
class event_reconciler
{
public:
  using persist_fn = std::function<void(collection, std::vector<reconciled_item>)>;

  explicit event_reconciler(persist_fn persist = {});

  auto set_persist_hook(persist_fn persist) -> void;

  /**
   * @brief Reconciles one event as a batch of one.
   */
  auto reconcile(const nostr::protocol::event_data &event, item_origin origin = item_origin::live)
    -> reconcile_outcome;

  /**
   * @brief Reconciles events in order, then persists changed collections.
   */
  auto reconcile_batch(const std::vector<nostr::protocol::event_data> &events,
    item_origin origin = item_origin::live) -> batch_result;

  /**
   * @brief Records an event created on this device.
   *
   * The item keeps its local-only flag until a relay delivers the same event.
   */
  auto add_local(const nostr::protocol::event_data &event) -> reconcile_outcome
  {
    return reconcile(event, item_origin::local);
  }

  /**
   * @brief Feeds cache-restored items through the reconciliation rules.
   *
   * Items keep their local-only flag. Nothing is persisted.
   */
  auto restore(const std::vector<reconciled_item> &items) -> batch_result;

  /// Reaction targets (last "e" tag) of positive reactions
  [[nodiscard]] auto liked_event_ids() const -> std::set<std::string>;

  [[nodiscard]] auto is_liked(const std::string &event_id) const -> bool;

  /// Id of the reaction event that liked the target, for unliking
  [[nodiscard]] auto reaction_id_for(const std::string &event_id) const -> std::optional<std::string>;

  /**
   * @brief Whether a repost references the target.
   *
   * @param target Event id or "kind:pubkey:d-tag" address
   */
  [[nodiscard]] auto has_reposted(const std::string &target) const -> bool;

  [[nodiscard]] auto repost_id_for(const std::string &target) const -> std::optional<std::string>;

  /// Followed pubkeys from the latest contact list of the author
  [[nodiscard]] auto following(const std::string &pubkey) const -> std::vector<std::string>;

  [[nodiscard]] auto is_following(const std::string &pubkey, const std::string &target) const -> bool;

  [[nodiscard]] auto follow_sets(const std::string &pubkey) const -> std::vector<follow_set>;

  [[nodiscard]] auto curated_lists(const std::string &pubkey) const -> std::vector<curated_list>;

  [[nodiscard]] auto snapshot(collection which) const -> std::vector<reconciled_item>;

  [[nodiscard]] auto size(collection which) const -> std::size_t;

  /**
   * @brief Drops every item of every collection (cache recovery).
   */
  auto clear() -> void;

private:
  struct pending_snapshot
  {
    collection which{};
    std::uint64_t generation{};
    std::vector<reconciled_item> items;
  };

  struct address_tombstone
  {
    std::string pubkey;
    std::uint64_t deleted_at{};
  };

  /// Caller holds mutex_
  auto reconcile_locked(const nostr::protocol::event_data &event, bool local_only, batch_result &result)
    -> reconcile_outcome;

  /// Caller holds mutex_
  auto is_deleted(collection which, const std::string &key, const nostr::protocol::event_data &event) const -> bool;

  /// Caller holds mutex_
  auto apply_deletion(const nostr::protocol::event_data &deletion, batch_result &result) -> void;

  /// Caller holds mutex_
  auto store(collection which) -> reconciled_store & { return stores_[which]; }

  /// Takes persist_mutex_; caller must not hold mutex_
  auto persist(const persist_fn &hook, std::vector<pending_snapshot> &snapshots) -> void;

  mutable std::mutex mutex_;
  std::map<collection, reconciled_store> stores_;
  std::set<std::pair<std::string, std::string>> deleted_event_ids_;///< (event id, deleting author)
  std::unordered_map<std::string, address_tombstone> deleted_addresses_;
  persist_fn persist_;
  std::map<collection, std::uint64_t> generations_;///< Bumped under mutex_ per mutating batch

  std::mutex persist_mutex_;
  std::map<collection, std::uint64_t> persisted_generations_;///< Guarded by persist_mutex_
};

}// namespace vine_sync::reconcile
