#pragma once

#include <async/async_queue.hpp>
#include <nostr/protocol.hpp>
#include <nostr/stream.hpp>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace vine_sync::nostr {

/**
 * @brief Subscription transport speaking NIP-01 frames to a single relay connection.
 *
 * Outbound REQ/CLOSE frames are pushed onto a frame queue drained by the
 * connection owner; inbound frames are fed back through handle_frame().
 * Each subscribe() call opens a new relay stream with a fresh identifier.
 */
class relay_transport
{
public:
  using frame_queue_t = async::async_queue<std::string>;

  explicit relay_transport(std::shared_ptr<frame_queue_t> outbound);

  relay_transport(const relay_transport &) = delete;
  auto operator=(const relay_transport &) -> relay_transport & = delete;
  relay_transport(relay_transport &&) = delete;
  auto operator=(relay_transport &&) -> relay_transport & = delete;
  ~relay_transport() = default;

  /**
   * @brief Opens a relay stream.
   *
   * @param filters Filters to send in the REQ frame
   * @param handlers Callbacks for the stream
   * @return Relay subscription id used as the transport handle
   * @throws std::runtime_error if the outbound frame queue rejects the REQ
   */
  auto subscribe(const std::vector<protocol::filter> &filters, stream_handlers handlers) -> std::string;

  /**
   * @brief Closes a relay stream and sends CLOSE. Unknown handles are ignored.
   */
  auto close(const std::string &handle) -> void;

  /**
   * @brief Routes one inbound relay frame to its stream.
   *
   * Malformed frames and frames for streams that are no longer open are discarded.
   */
  auto handle_frame(const std::string &frame) -> void;

  /**
   * @brief Fails every open stream after the connection dropped.
   *
   * @param reason Error text delivered to each stream's on_error
   */
  auto handle_disconnect(const std::string &reason) -> void;

  [[nodiscard]] auto open_streams() const -> std::size_t;

private:
  auto find_handlers(const std::string &handle) const -> std::optional<stream_handlers>;
  auto take_handlers(const std::string &handle) -> std::optional<stream_handlers>;

  auto handle(const protocol::event &frame) -> void;
  auto handle(const protocol::eose &frame) -> void;
  auto handle(const protocol::closed &frame) -> void;
  static auto handle(const protocol::notice &frame) -> void;

  std::shared_ptr<frame_queue_t> outbound_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, stream_handlers> streams_;
};

}// namespace vine_sync::nostr
