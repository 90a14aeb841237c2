#pragma once

#include <async/async_queue.hpp>
#include <concepts/key_value_store.hpp>
#include <concepts/subscription_transport.hpp>
#include <nostr/protocol.hpp>
#include <reconcile/collections.hpp>
#include <reconcile/event_reconciler.hpp>
#include <storage/cache_persister.hpp>
#include <subscription/subscription_manager.hpp>
#include <subscription/subscription_types.hpp>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/experimental/channel_error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/system/system_error.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace vine_sync::engine {

inline constexpr std::size_t default_max_batch_size = 256;

/// Tunables of a sync_engine
struct sync_engine_options
{
  subscription::subscription_config subscriptions;
  std::string cache_namespace{ storage::default_cache_namespace };
  double corruption_threshold{ storage::default_corruption_threshold };
  /// Raised to subscriptions.max_events_per_minute so a minute of admitted events always fits
  std::size_t queue_capacity{ async::async_queue<nostr::protocol::event_data>::default_capacity };
  std::size_t max_batch_size{ default_max_batch_size };
};

/**
 * @brief Wires managed subscriptions, reconciliation and the local cache.
 *
 * Delivery callbacks only push onto the inbound queue; run() pops and
 * reconciles in batches, and the reconciler persists every mutated collection
 * through the cache persister. The engine is owned by the application.
 *
 * @tparam Transport Type satisfying concepts::subscription_transport
 * @tparam Store Type satisfying concepts::key_value_store
 */
template<concepts::subscription_transport Transport, concepts::key_value_store Store> class sync_engine
{
public:
  using manager_t = subscription::subscription_manager<Transport>;
  using persister_t = storage::cache_persister<Store>;
  using queue_t = async::async_queue<nostr::protocol::event_data>;

  sync_engine(const std::shared_ptr<Transport> &transport,
    const std::shared_ptr<Store> &store,
    const std::shared_ptr<boost::asio::io_context> &io_context,
    std::string user_pubkey,
    sync_engine_options options = {},
    subscription::rate_limiter::clock_fn clock = {})
    : options_(std::move(options)), user_pubkey_(std::move(user_pubkey)),
      manager_(std::make_shared<manager_t>(transport, io_context, options_.subscriptions, std::move(clock))),
      reconciler_(std::make_shared<reconcile::event_reconciler>()),
      persister_(std::make_shared<persister_t>(store, options_.cache_namespace, options_.corruption_threshold)),
      inbound_(std::make_shared<queue_t>(io_context,
        std::max(options_.queue_capacity, options_.subscriptions.max_events_per_minute)))
  {
    if (user_pubkey_.empty()) { throw std::invalid_argument("sync_engine requires the user's pubkey"); }
    if (options_.max_batch_size == 0) { throw std::invalid_argument("Batch size must be positive"); }

    reconciler_->set_persist_hook(
      [persister = persister_](reconcile::collection which, std::vector<reconcile::reconciled_item> items) {
        std::ignore = persister->persist(which, items);
      });
  }

  sync_engine(const sync_engine &) = delete;
  auto operator=(const sync_engine &) -> sync_engine & = delete;
  sync_engine(sync_engine &&) = delete;
  auto operator=(sync_engine &&) -> sync_engine & = delete;

  ~sync_engine() { stop(); }

  /**
   * @brief Restores the cache and opens the personal subscriptions.
   *
   * @return Per-collection cache load reports
   */
  auto start() -> std::map<reconcile::collection, storage::load_report>
  {
    auto reports = persister_->load_all(*reconciler_);
    for (const auto &[which, report] : reports) {
      if (report.discarded) {
        spdlog::warn("[sync_engine] Cache for {} discarded, rebuilding from relays", reconcile::to_string(which));
      }
    }

    using nostr::protocol::kind;
    using nostr::protocol::to_number;

    open_personal("personal_reactions", { to_number(kind::reaction) }, 3);
    open_personal("personal_reposts", { to_number(kind::repost), to_number(kind::generic_repost) }, 3);
    open_personal("personal_deletions", { to_number(kind::deletion) }, 3);
    open_personal("personal_contact_list", { to_number(kind::contact_list) }, 2, 1);
    open_personal("personal_follow_sets", { to_number(kind::follow_set) }, 4);
    open_personal("personal_curation_sets", { to_number(kind::curation_set) }, 4);

    spdlog::info(
      "[sync_engine] Started for {} with {} personal subscriptions", user_pubkey_, personal_names_.size());
    return reports;
  }

  /**
   * @brief Opens an application subscription whose events are also reconciled.
   *
   * The request's own on_event still runs for each admitted event.
   */
  auto subscribe(subscription::subscription_request request) -> std::string
  {
    auto forward = std::move(request.on_event);
    request.on_event = [inbound = inbound_, dropped = dropped_, forward = std::move(forward)](
                         const nostr::protocol::event_data &event) {
      enqueue(*inbound, *dropped, event);
      if (forward) { forward(event); }
    };
    return manager_->create_subscription(std::move(request));
  }

  /**
   * @brief Records a locally created event (optimistic write).
   */
  auto add_local(const nostr::protocol::event_data &event) -> reconcile::reconcile_outcome
  {
    return reconciler_->add_local(event);
  }

  /**
   * @brief Pops one event and reconciles it together with everything already queued.
   */
  auto run_once(std::shared_ptr<boost::asio::cancellation_slot> cancel_slot = nullptr) -> boost::asio::awaitable<void>
  {
    std::vector<nostr::protocol::event_data> batch;
    batch.push_back(co_await inbound_->pop(cancel_slot));

    auto rest = inbound_->drain(options_.max_batch_size - 1);
    batch.insert(batch.end(), std::make_move_iterator(rest.begin()), std::make_move_iterator(rest.end()));

    auto result = reconciler_->reconcile_batch(batch, reconcile::item_origin::live);
    spdlog::trace("[sync_engine] Reconciled batch of {} ({} malformed)",
      batch.size(),
      result.count(reconcile::reconcile_outcome::malformed));
    co_return;
  }

  /**
   * @brief Reconciles inbound events until cancelled or stopped.
   */
  auto run(std::shared_ptr<boost::asio::cancellation_slot> cancel_slot = nullptr) -> boost::asio::awaitable<void>
  {
    try {
      while (true) { co_await run_once(cancel_slot); }
    } catch (const boost::system::system_error &e) {
      if (e.code() == boost::asio::error::operation_aborted
          or e.code() == boost::asio::experimental::error::channel_cancelled
          or e.code() == boost::asio::experimental::error::channel_closed) {
        spdlog::debug("[sync_engine] Cancelled, exiting run loop");
        co_return;
      } else {
        spdlog::error("[sync_engine] Unexpected error in run loop: {}", e.what());
        throw;
      }
    }
  }

  /**
   * @brief Cancels every subscription and pending retry and closes the inbound queue.
   */
  auto stop() -> void
  {
    if (stopped_.exchange(true)) { return; }
    manager_->shutdown();
    inbound_->close();
    spdlog::info("[sync_engine] Stopped");
  }

  /**
   * @brief Drops the cached and in-memory state (cache recovery).
   */
  auto reset_cache() -> void
  {
    persister_->clear_all();
    reconciler_->clear();
  }

  [[nodiscard]] auto reconciler() const -> const std::shared_ptr<reconcile::event_reconciler> & { return reconciler_; }

  [[nodiscard]] auto manager() const -> const std::shared_ptr<manager_t> & { return manager_; }

  [[nodiscard]] auto persister() const -> const std::shared_ptr<persister_t> & { return persister_; }

  [[nodiscard]] auto personal_subscription_names() const -> const std::vector<std::string> & { return personal_names_; }

  /**
   * @brief Ids of the active personal subscriptions.
   *
   * A retry replaces the id of a failed subscription, so this is looked up
   * from the manager on every call.
   */
  [[nodiscard]] auto personal_subscription_ids() const -> std::vector<std::string>
  {
    std::vector<std::string> ids;
    for (const auto &details : manager_->get_stats().subscriptions) {
      if (std::ranges::find(personal_names_, details.name) != personal_names_.end()) { ids.push_back(details.id); }
    }
    return ids;
  }

  /// Events dropped because the inbound queue was full
  [[nodiscard]] auto dropped_events() const -> std::size_t { return dropped_->load(); }

  [[nodiscard]] auto pending_events() const -> std::size_t { return inbound_->size(); }

private:
  static auto enqueue(queue_t &inbound, std::atomic<std::size_t> &dropped, const nostr::protocol::event_data &event)
    -> void
  {
    if (not inbound.push(event)) {
      ++dropped;
      spdlog::warn("[sync_engine] Inbound queue full, dropping event {}", event.id);
    }
  }

  auto open_personal(const std::string &name,
    std::vector<std::uint32_t> kinds,
    int priority,
    std::optional<std::uint32_t> limit = std::nullopt) -> void
  {
    nostr::protocol::filter filter;
    filter.authors = std::vector<std::string>{ user_pubkey_ };
    filter.kinds = std::move(kinds);
    filter.limit = limit;

    try {
      std::ignore = subscribe(subscription::subscription_request{
        .name = name,
        .filters = { std::move(filter) },
        .on_event = {},
        .on_error = [name](const std::string &error) {
          spdlog::warn("[sync_engine] Personal subscription {} failed: {}", name, error);
        },
        .on_complete = {},
        .on_eose = {},
        .timeout = subscription::no_timeout,
        .priority = priority,
        .complete_on_eose = false,
      });
      personal_names_.push_back(name);
    } catch (const std::exception &e) {
      spdlog::error("[sync_engine] Failed to open personal subscription {}: {}", name, e.what());
    }
  }

  sync_engine_options options_;
  std::string user_pubkey_;
  std::shared_ptr<manager_t> manager_;
  std::shared_ptr<reconcile::event_reconciler> reconciler_;
  std::shared_ptr<persister_t> persister_;
  std::shared_ptr<queue_t> inbound_;
  std::shared_ptr<std::atomic<std::size_t>> dropped_{ std::make_shared<std::atomic<std::size_t>>(0) };
  std::vector<std::string> personal_names_;
  std::atomic<bool> stopped_{ false };
};

}// namespace vine_sync::engine
