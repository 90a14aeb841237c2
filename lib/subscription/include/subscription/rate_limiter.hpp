#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>

namespace vine_sync::subscription {

/**
 * @brief Sliding-window admission gate for delivered events.
 *
 * Counts admissions over the trailing window and rejects once the ceiling is
 * reached. Rejected events are not queued. Not thread-safe; the owning
 * subscription_manager serializes calls.
 */
class rate_limiter
{
public:
  using clock_type = std::chrono::steady_clock;
  using clock_fn = std::function<clock_type::time_point()>;

  static constexpr std::size_t default_ceiling = 2000;
  static constexpr std::chrono::seconds default_window{ 60 };

  /**
   * @param ceiling Maximum admissions within any trailing window
   * @param window Length of the sliding window
   * @param clock Time source, steady_clock::now when empty
   * @throws std::invalid_argument if ceiling is zero or window is not positive
   */
  explicit rate_limiter(std::size_t ceiling = default_ceiling,
    std::chrono::milliseconds window = default_window,
    clock_fn clock = {});

  /**
   * @brief Admits one event if the window has room and records it.
   *
   * @return true if admitted, false if the event must be dropped
   */
  [[nodiscard]] auto admit() -> bool;

  /// Number of admissions inside the current window
  [[nodiscard]] auto events_in_window() -> std::size_t;

  [[nodiscard]] auto ceiling() const -> std::size_t { return ceiling_; }

private:
  auto prune(clock_type::time_point now) -> void;

  std::size_t ceiling_;
  std::chrono::milliseconds window_;
  clock_fn clock_;
  std::deque<clock_type::time_point> admitted_;
};

}// namespace vine_sync::subscription
