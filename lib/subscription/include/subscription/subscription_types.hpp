#pragma once

#include <nostr/filter_optimizer.hpp>
#include <nostr/protocol.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vine_sync::subscription {

/// Highest logical priority
inline constexpr int highest_priority = 1;
/// Lowest logical priority; evicted first
inline constexpr int lowest_priority = 10;
inline constexpr int default_priority = 5;

/// Request timeout that keeps the subscription open until it is cancelled, evicted or fails
inline constexpr std::chrono::milliseconds no_timeout{ 0 };

/**
 * @brief Limits and timings for managed subscriptions.
 */
struct subscription_config
{
  std::size_t max_concurrent_subscriptions{ 30 };
  std::size_t max_events_per_minute{ 2000 };
  std::chrono::milliseconds default_timeout{ std::chrono::minutes(15) };
  std::chrono::milliseconds retry_delay{ std::chrono::seconds(30) };
  std::optional<std::size_t> max_retry_attempts;///< Unlimited when unset
  std::uint32_t max_filter_limit{ nostr::default_max_filter_limit };
};

/**
 * @brief Why a managed subscription left the active set.
 */
enum class termination_reason : std::uint8_t {
  cancelled,///< Explicit cancel or shutdown
  timed_out,///< Deadline elapsed
  completed,///< Upstream closed the stream
  evicted,///< Displaced by a new admission at capacity
  errored,///< Transport error; a retry is scheduled
};

[[nodiscard]] constexpr auto to_string(termination_reason reason) -> std::string_view
{
  switch (reason) {
  case termination_reason::cancelled:
    return "cancelled";
  case termination_reason::timed_out:
    return "timed_out";
  case termination_reason::completed:
    return "completed";
  case termination_reason::evicted:
    return "evicted";
  case termination_reason::errored:
    return "errored";
  }
  return "unknown";
}

/**
 * @brief Parameters of a managed subscription.
 *
 * A retry re-issues the same request, so callbacks must stay valid for as
 * long as the manager may retry.
 */
struct subscription_request
{
  std::string name;///< Logical name, shared by retries
  std::vector<nostr::protocol::filter> filters;
  std::function<void(const nostr::protocol::event_data &)> on_event;
  std::function<void(const std::string &)> on_error;
  std::function<void()> on_complete;
  std::function<void()> on_eose;
  std::optional<std::chrono::milliseconds> timeout;///< Manager default when unset, never with no_timeout
  int priority{ default_priority };///< 1 = highest, 10 = lowest
  bool complete_on_eose{ false };///< Treat EOSE as stream completion
};

/// Snapshot of one active subscription
struct subscription_details
{
  std::string id;
  std::string name;
  int priority{};
  std::chrono::seconds age{};
  std::size_t filter_count{};
};

/// Manager statistics
struct subscription_stats
{
  std::size_t active_subscriptions{};
  std::size_t max_subscriptions{};
  std::size_t events_last_minute{};
  std::size_t max_events_per_minute{};
  std::size_t dropped_events{};
  std::size_t pending_retries{};
  std::map<termination_reason, std::size_t> terminations;
  std::vector<subscription_details> subscriptions;
};

}// namespace vine_sync::subscription
