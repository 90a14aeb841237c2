#pragma once

#include <concepts>
#include <nostr/protocol.hpp>
#include <nostr/stream.hpp>
#include <string>
#include <vector>

namespace vine_sync::concepts {

/**
 * @brief Concept for the collaborator that opens event streams on relays.
 *
 * subscribe() returns a transport handle that is never shared between two
 * streams; close() releases it and is a no-op for unknown or closed handles.
 */
template<typename T>
concept subscription_transport = requires(T transport,
  const std::vector<nostr::protocol::filter> &filters,
  nostr::stream_handlers handlers,
  const std::string &handle) {
  { transport.subscribe(filters, std::move(handlers)) } -> std::same_as<std::string>;
  transport.close(handle);
};

}// namespace vine_sync::concepts
