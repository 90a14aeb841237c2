#include <subscription/rate_limiter.hpp>

#include <stdexcept>
#include <utility>

namespace vine_sync::subscription {

rate_limiter::rate_limiter(std::size_t ceiling, std::chrono::milliseconds window, clock_fn clock)
  : ceiling_(ceiling), window_(window), clock_(std::move(clock))
{
  if (ceiling_ == 0) { throw std::invalid_argument("Rate limit ceiling must be positive"); }
  if (window_ <= std::chrono::milliseconds::zero()) { throw std::invalid_argument("Rate limit window must be positive"); }
  if (not clock_) {
    clock_ = [] { return clock_type::now(); };
  }
}

auto rate_limiter::admit() -> bool
{
  const auto now = clock_();
  prune(now);
  if (admitted_.size() >= ceiling_) { return false; }
  admitted_.push_back(now);
  return true;
}

auto rate_limiter::events_in_window() -> std::size_t
{
  prune(clock_());
  return admitted_.size();
}

auto rate_limiter::prune(clock_type::time_point now) -> void
{
  const auto cutoff = now - window_;
  while (not admitted_.empty() and admitted_.front() < cutoff) { admitted_.pop_front(); }
}

}// namespace vine_sync::subscription
