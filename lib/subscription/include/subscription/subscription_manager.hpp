#pragma once

#include <concepts/subscription_transport.hpp>
#include <core/id_generator.hpp>
#include <nostr/filter_optimizer.hpp>
#include <nostr/stream.hpp>
#include <subscription/rate_limiter.hpp>
#include <subscription/subscription_types.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <tuple>
#include <unordered_map>
#include <utility>
#include <vector>

namespace vine_sync::subscription {

/**
 * @brief Bounded pool of managed relay subscriptions.
 *
 * Admission, eviction and deregistration run under one mutex; transport calls
 * and user callbacks run outside it. When the pool is full a new admission
 * evicts one subscription with the numerically largest priority (earliest
 * admitted among equals) before registering. Delivered events pass the rate
 * limiter. A transport error ends the subscription and schedules a retry of the
 * same request after a fixed delay.
 *
 * Must be owned by a std::shared_ptr; timers and transport callbacks hold weak
 * references to it.
 *
 * @tparam Transport Type satisfying concepts::subscription_transport
 */
template<concepts::subscription_transport Transport>
class subscription_manager : public std::enable_shared_from_this<subscription_manager<Transport>>
{
public:
  using clock_type = std::chrono::steady_clock;

  subscription_manager(const std::shared_ptr<Transport> &transport,
    const std::shared_ptr<boost::asio::io_context> &io_context,
    subscription_config config = {},
    rate_limiter::clock_fn clock = {})
    : transport_(transport), io_context_(io_context), config_(std::move(config)),
      limiter_(config_.max_events_per_minute, rate_limiter::default_window, std::move(clock))
  {
    if (config_.max_concurrent_subscriptions == 0) {
      throw std::invalid_argument("Subscription ceiling must be positive");
    }
  }

  subscription_manager(const subscription_manager &) = delete;
  auto operator=(const subscription_manager &) -> subscription_manager & = delete;
  subscription_manager(subscription_manager &&) = delete;
  auto operator=(subscription_manager &&) -> subscription_manager & = delete;

  ~subscription_manager() { shutdown(); }

  /**
   * @brief Creates a managed subscription.
   *
   * @param request Subscription parameters
   * @return Managed subscription id, unique per call
   * @throws std::invalid_argument if the priority is outside 1..10
   * @throws std::runtime_error after shutdown()
   * @throws any exception thrown by the transport's subscribe()
   */
  auto create_subscription(subscription_request request) -> std::string
  {
    return create(std::move(request), 0);
  }

  /**
   * @brief Cancels one subscription.
   *
   * @return true if the subscription was active
   */
  auto cancel_subscription(const std::string &subscription_id) -> bool
  {
    return terminate(subscription_id, termination_reason::cancelled);
  }

  /**
   * @brief Cancels every subscription whose name contains the pattern.
   *
   * @return Number of subscriptions cancelled
   */
  auto cancel_subscriptions_by_name(const std::string &name_pattern) -> std::size_t
  {
    std::vector<std::string> matching;
    {
      const std::scoped_lock lock(mutex_);
      for (const auto &[id, entry] : active_) {
        if (entry.request.name.find(name_pattern) != std::string::npos) { matching.push_back(id); }
      }
    }

    spdlog::debug("[subscription_manager] Cancelling {} subscriptions matching: {}", matching.size(), name_pattern);

    std::size_t cancelled = 0;
    for (const auto &id : matching) {
      if (cancel_subscription(id)) { ++cancelled; }
    }
    return cancelled;
  }

  [[nodiscard]] auto is_active(const std::string &subscription_id) const -> bool
  {
    const std::scoped_lock lock(mutex_);
    return active_.contains(subscription_id);
  }

  [[nodiscard]] auto active_count() const -> std::size_t
  {
    const std::scoped_lock lock(mutex_);
    return active_.size();
  }

  [[nodiscard]] auto pending_retries() const -> std::size_t
  {
    const std::scoped_lock lock(mutex_);
    return retries_.size();
  }

  [[nodiscard]] auto get_stats() -> subscription_stats
  {
    const std::scoped_lock lock(mutex_);
    const auto now = clock_type::now();

    subscription_stats stats{ .active_subscriptions = active_.size(),
      .max_subscriptions = config_.max_concurrent_subscriptions,
      .events_last_minute = limiter_.events_in_window(),
      .max_events_per_minute = limiter_.ceiling(),
      .dropped_events = dropped_events_,
      .pending_retries = retries_.size(),
      .terminations = terminations_,
      .subscriptions = {} };

    stats.subscriptions.reserve(active_.size());
    for (const auto &[id, entry] : active_) {
      stats.subscriptions.push_back(subscription_details{ .id = id,
        .name = entry.request.name,
        .priority = entry.request.priority,
        .age = std::chrono::duration_cast<std::chrono::seconds>(now - entry.created_at),
        .filter_count = entry.filters.size() });
    }
    return stats;
  }

  /**
   * @brief Cancels every subscription and pending retry.
   *
   * Further create_subscription() calls throw. Safe to call more than once.
   */
  auto shutdown() -> void
  {
    std::unordered_map<std::string, active_subscription> active;
    std::unordered_map<std::string, retry_task> retries;
    {
      const std::scoped_lock lock(mutex_);
      if (shut_down_) { return; }
      shut_down_ = true;
      active.swap(active_);
      retries.swap(retries_);
    }

    spdlog::debug("[subscription_manager] Shutting down: {} subscriptions, {} retries", active.size(), retries.size());

    for (auto &[id, entry] : active) { finish(entry, termination_reason::cancelled); }
    for (auto &[id, task] : retries) { task.timer->cancel(); }
  }

private:
  struct active_subscription
  {
    std::string id;
    subscription_request request;
    std::vector<nostr::protocol::filter> filters;///< Optimized filters sent to the transport
    clock_type::time_point created_at;
    std::uint64_t sequence{};
    std::size_t attempt{};
    std::optional<std::string> transport_handle;
    std::shared_ptr<boost::asio::steady_timer> timeout_timer;
  };

  struct retry_task
  {
    subscription_request request;
    clock_type::time_point fire_at;
    std::size_t attempt{};
    std::shared_ptr<boost::asio::steady_timer> timer;
  };

  std::shared_ptr<Transport> transport_;
  std::shared_ptr<boost::asio::io_context> io_context_;
  subscription_config config_;

  mutable std::mutex mutex_;
  rate_limiter limiter_;
  std::unordered_map<std::string, active_subscription> active_;
  std::unordered_map<std::string, retry_task> retries_;
  std::map<termination_reason, std::size_t> terminations_;
  std::uint64_t next_sequence_{ 0 };
  std::size_t dropped_events_{ 0 };
  bool shut_down_{ false };

  auto create(subscription_request request, std::size_t attempt) -> std::string
  {
    if (request.priority < highest_priority or request.priority > lowest_priority) {
      throw std::invalid_argument("Subscription priority must be between 1 and 10");
    }

    auto filters = nostr::optimize_filters(request.filters, config_.max_filter_limit);
    auto subscription_id = core::id_generator::subscription_id(request.name);
    const auto timeout = request.timeout.value_or(config_.default_timeout);
    const auto priority = request.priority;
    const auto filter_count = filters.size();

    std::optional<active_subscription> evicted;
    std::size_t active_after = 0;
    {
      const std::scoped_lock lock(mutex_);
      if (shut_down_) { throw std::runtime_error("Subscription manager is shut down"); }

      if (active_.size() >= config_.max_concurrent_subscriptions) { evicted = take_lowest_priority(); }

      auto timer = std::make_shared<boost::asio::steady_timer>(*io_context_);
      if (timeout > no_timeout) {
        timer->expires_after(timeout);
        timer->async_wait([weak_self = this->weak_from_this(), subscription_id](const boost::system::error_code &error) {
          if (error) { return; }
          if (auto self = weak_self.lock()) {
            spdlog::debug("[subscription_manager] Subscription timeout: {}", subscription_id);
            self->terminate(subscription_id, termination_reason::timed_out);
          }
        });
      }

      active_.emplace(subscription_id,
        active_subscription{ .id = subscription_id,
          .request = std::move(request),
          .filters = filters,
          .created_at = clock_type::now(),
          .sequence = next_sequence_++,
          .attempt = attempt,
          .transport_handle = std::nullopt,
          .timeout_timer = std::move(timer) });
      active_after = active_.size();
    }

    if (evicted) {
      spdlog::debug("[subscription_manager] Evicting lowest priority subscription: {} (priority: {})",
        evicted->id,
        evicted->request.priority);
      finish(*evicted, termination_reason::evicted);
    }

    spdlog::info("[subscription_manager] Creating managed subscription: {} (filters: {}, priority: {}, active: {}/{})",
      subscription_id,
      filter_count,
      priority,
      active_after,
      config_.max_concurrent_subscriptions);

    std::string handle;
    try {
      handle = transport_->subscribe(filters, make_handlers(subscription_id));
    } catch (const std::exception &e) {
      spdlog::error("[subscription_manager] Failed to create subscription {}: {}", subscription_id, e.what());
      std::optional<active_subscription> failed;
      {
        const std::scoped_lock lock(mutex_);
        failed = take(subscription_id);
      }
      if (failed) { failed->timeout_timer->cancel(); }
      throw;
    }

    bool registered = false;
    {
      const std::scoped_lock lock(mutex_);
      auto iter = active_.find(subscription_id);
      if (iter != active_.end()) {
        iter->second.transport_handle = handle;
        registered = true;
      }
    }

    // Terminated while the transport was subscribing; the handle is ours to release.
    if (not registered) { transport_->close(handle); }

    return subscription_id;
  }

  auto make_handlers(const std::string &subscription_id) -> nostr::stream_handlers
  {
    auto weak_self = this->weak_from_this();
    return nostr::stream_handlers{
      .on_event =
        [weak_self, subscription_id](const nostr::protocol::event_data &event) {
          if (auto self = weak_self.lock()) { self->deliver(subscription_id, event); }
        },
      .on_eose =
        [weak_self, subscription_id]() {
          if (auto self = weak_self.lock()) { self->handle_eose(subscription_id); }
        },
      .on_error =
        [weak_self, subscription_id](const std::string &error) {
          if (auto self = weak_self.lock()) { self->handle_error(subscription_id, error); }
        },
      .on_complete =
        [weak_self, subscription_id]() {
          if (auto self = weak_self.lock()) { self->handle_complete(subscription_id); }
        },
    };
  }

  auto deliver(const std::string &subscription_id, const nostr::protocol::event_data &event) -> void
  {
    std::function<void(const nostr::protocol::event_data &)> callback;
    {
      const std::scoped_lock lock(mutex_);
      auto iter = active_.find(subscription_id);
      if (iter == active_.end()) { return; }

      if (not limiter_.admit()) {
        ++dropped_events_;
        spdlog::warn("[subscription_manager] Rate limit exceeded, dropping event {} for {}", event.id, subscription_id);
        return;
      }
      iter->second.attempt = 0;
      callback = iter->second.request.on_event;
    }

    spdlog::trace("[subscription_manager] Forwarding event kind={} id={} to {}", event.kind, event.id, subscription_id);
    if (callback) { callback(event); }
  }

  auto handle_eose(const std::string &subscription_id) -> void
  {
    std::function<void()> callback;
    bool complete = false;
    {
      const std::scoped_lock lock(mutex_);
      auto iter = active_.find(subscription_id);
      if (iter == active_.end()) { return; }
      iter->second.attempt = 0;
      callback = iter->second.request.on_eose;
      complete = iter->second.request.complete_on_eose;
    }

    if (callback) { callback(); }
    if (complete) { handle_complete(subscription_id); }
  }

  auto handle_complete(const std::string &subscription_id) -> void
  {
    std::optional<active_subscription> entry;
    {
      const std::scoped_lock lock(mutex_);
      entry = take(subscription_id);
    }
    if (not entry) { return; }

    spdlog::info("[subscription_manager] Subscription completed: {}", subscription_id);
    finish(*entry, termination_reason::completed);
    if (entry->request.on_complete) { entry->request.on_complete(); }
  }

  auto handle_error(const std::string &subscription_id, const std::string &error) -> void
  {
    std::optional<active_subscription> entry;
    {
      const std::scoped_lock lock(mutex_);
      entry = take(subscription_id);
    }
    if (not entry) { return; }

    spdlog::error("[subscription_manager] Subscription error in {}: {}", subscription_id, error);
    finish(*entry, termination_reason::errored);
    if (entry->request.on_error) { entry->request.on_error(error); }
    schedule_retry(std::move(entry->request), entry->attempt + 1);
  }

  auto schedule_retry(subscription_request request, std::size_t attempt) -> void
  {
    if (config_.max_retry_attempts and attempt > *config_.max_retry_attempts) {
      spdlog::warn("[subscription_manager] Giving up on {} after {} retries", request.name, attempt - 1);
      return;
    }

    const std::string name = request.name;
    auto retry_id = core::id_generator::subscription_id(name + "_retry");
    {
      const std::scoped_lock lock(mutex_);
      if (shut_down_) { return; }

      auto timer = std::make_shared<boost::asio::steady_timer>(*io_context_, config_.retry_delay);
      timer->async_wait([weak_self = this->weak_from_this(), retry_id](const boost::system::error_code &error) {
        if (error) { return; }
        if (auto self = weak_self.lock()) { self->fire_retry(retry_id); }
      });

      retries_.emplace(retry_id,
        retry_task{ .request = std::move(request),
          .fire_at = clock_type::now() + config_.retry_delay,
          .attempt = attempt,
          .timer = std::move(timer) });
    }

    spdlog::info("[subscription_manager] Scheduled retry {} of {} in {}ms", attempt, name, config_.retry_delay.count());
  }

  auto fire_retry(const std::string &retry_id) -> void
  {
    std::optional<retry_task> task;
    {
      const std::scoped_lock lock(mutex_);
      auto node = retries_.extract(retry_id);
      if (node.empty()) { return; }
      task = std::move(node.mapped());
    }

    spdlog::warn("[subscription_manager] Retrying subscription: {} (attempt {})", task->request.name, task->attempt);
    try {
      std::ignore = create(std::move(task->request), task->attempt);
    } catch (const std::exception &e) {
      spdlog::error("[subscription_manager] Retry failed for {}: {}", task->request.name, e.what());
    }
  }

  auto terminate(const std::string &subscription_id, termination_reason reason) -> bool
  {
    std::optional<active_subscription> entry;
    {
      const std::scoped_lock lock(mutex_);
      entry = take(subscription_id);
    }
    if (not entry) { return false; }

    finish(*entry, reason);
    return true;
  }

  /// Caller holds mutex_
  auto take(const std::string &subscription_id) -> std::optional<active_subscription>
  {
    auto node = active_.extract(subscription_id);
    if (node.empty()) { return std::nullopt; }
    return std::move(node.mapped());
  }

  /// Caller holds mutex_. Largest priority number loses; earliest admission among equals.
  auto take_lowest_priority() -> std::optional<active_subscription>
  {
    auto victim = active_.end();
    for (auto iter = active_.begin(); iter != active_.end(); ++iter) {
      if (victim == active_.end() or iter->second.request.priority > victim->second.request.priority
          or (iter->second.request.priority == victim->second.request.priority
              and iter->second.sequence < victim->second.sequence)) {
        victim = iter;
      }
    }
    if (victim == active_.end()) { return std::nullopt; }
    return take(victim->first);
  }

  /// Releases the timer and transport handle of a deregistered subscription.
  auto finish(active_subscription &entry, termination_reason reason) -> void
  {
    entry.timeout_timer->cancel();
    if (entry.transport_handle) {
      try {
        transport_->close(*entry.transport_handle);
      } catch (const std::exception &e) {
        spdlog::error("[subscription_manager] Failed to close transport handle for {}: {}", entry.id, e.what());
      }
    }

    {
      const std::scoped_lock lock(mutex_);
      ++terminations_[reason];
    }
    spdlog::debug("[subscription_manager] Subscription {} ended: {}", entry.id, to_string(reason));
  }
};

}// namespace vine_sync::subscription
