#pragma once

#include <cstdint>
#include <nostr/protocol.hpp>
#include <vector>

namespace vine_sync::nostr {

/// Largest per-filter result count a subscription may request
inline constexpr std::uint32_t default_max_filter_limit = 100;

/**
 * @brief Clamps result limits before filters are handed to a relay.
 *
 * Every filter keeps its ids, authors, kinds, tag filters and time bounds;
 * only a limit above max_limit is lowered to max_limit. Order is preserved.
 *
 * @param filters Filters as requested by the caller
 * @param max_limit Upper bound for any limit field
 * @return Optimized copy of the filters
 */
[[nodiscard]] auto optimize_filters(const std::vector<protocol::filter> &filters,
  std::uint32_t max_limit = default_max_filter_limit) -> std::vector<protocol::filter>;

}// namespace vine_sync::nostr
