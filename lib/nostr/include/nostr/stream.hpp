#pragma once

#include <functional>
#include <nostr/protocol.hpp>
#include <string>

namespace vine_sync::nostr {

/**
 * @brief Callbacks a transport invokes for one subscription stream.
 *
 * Any member may be empty. After on_error or on_complete the transport
 * delivers nothing further for the stream.
 */
struct stream_handlers
{
  std::function<void(const protocol::event_data &)> on_event;
  std::function<void()> on_eose;
  std::function<void(const std::string &)> on_error;
  std::function<void()> on_complete;
};

}// namespace vine_sync::nostr
