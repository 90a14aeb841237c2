#include <nostr/filter_optimizer.hpp>

#include <spdlog/spdlog.h>

namespace vine_sync::nostr {

auto optimize_filters(const std::vector<protocol::filter> &filters, std::uint32_t max_limit)
  -> std::vector<protocol::filter>
{
  std::vector<protocol::filter> optimized;
  optimized.reserve(filters.size());

  for (const auto &requested : filters) {
    auto clamped = requested;
    if (clamped.limit and *clamped.limit > max_limit) {
      spdlog::debug("[filter_optimizer] Capping filter limit {} to {}", *clamped.limit, max_limit);
      clamped.limit = max_limit;
    }
    optimized.push_back(std::move(clamped));
  }

  spdlog::trace("[filter_optimizer] Optimized {} filters", optimized.size());
  return optimized;
}

}// namespace vine_sync::nostr
