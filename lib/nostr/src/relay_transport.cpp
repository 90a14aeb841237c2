#include <nostr/relay_transport.hpp>

#include <core/id_generator.hpp>
#include <spdlog/spdlog.h>

#include <stdexcept>
#include <utility>
#include <variant>

namespace vine_sync::nostr {

relay_transport::relay_transport(std::shared_ptr<frame_queue_t> outbound) : outbound_(std::move(outbound)) {}

auto relay_transport::subscribe(const std::vector<protocol::filter> &filters, stream_handlers handlers) -> std::string
{
  auto handle = core::id_generator::random_hex();
  protocol::validate_subscription_id(handle);

  {
    const std::scoped_lock lock(mutex_);
    streams_.emplace(handle, std::move(handlers));
  }

  const protocol::req request{ .subscription_id = handle, .filters = filters };
  if (not outbound_->push(request.serialize())) {
    const std::scoped_lock lock(mutex_);
    streams_.erase(handle);
    throw std::runtime_error("Outbound frame queue rejected REQ");
  }

  spdlog::debug("[relay_transport] Opened stream {} with {} filters", handle, filters.size());
  return handle;
}

auto relay_transport::close(const std::string &handle) -> void
{
  if (not take_handlers(handle)) { return; }

  const protocol::close_request request{ .subscription_id = handle };
  if (not outbound_->push(request.serialize())) {
    spdlog::warn("[relay_transport] Outbound frame queue rejected CLOSE for {}", handle);
    return;
  }
  spdlog::debug("[relay_transport] Closed stream {}", handle);
}

auto relay_transport::handle_frame(const std::string &frame) -> void
{
  auto parsed = protocol::parse_relay_frame(frame);
  if (not parsed) {
    spdlog::debug("[relay_transport] Discarding malformed frame: {}", frame);
    return;
  }
  std::visit([this](const auto &decoded) { handle(decoded); }, *parsed);
}

auto relay_transport::handle_disconnect(const std::string &reason) -> void
{
  std::unordered_map<std::string, stream_handlers> failed;
  {
    const std::scoped_lock lock(mutex_);
    failed.swap(streams_);
  }

  spdlog::warn("[relay_transport] Connection lost ({}), failing {} streams", reason, failed.size());
  for (auto &[handle, handlers] : failed) {
    if (handlers.on_error) { handlers.on_error(reason); }
  }
}

auto relay_transport::open_streams() const -> std::size_t
{
  const std::scoped_lock lock(mutex_);
  return streams_.size();
}

auto relay_transport::find_handlers(const std::string &handle) const -> std::optional<stream_handlers>
{
  const std::scoped_lock lock(mutex_);
  auto iter = streams_.find(handle);
  if (iter == streams_.end()) { return std::nullopt; }
  return iter->second;
}

auto relay_transport::take_handlers(const std::string &handle) -> std::optional<stream_handlers>
{
  const std::scoped_lock lock(mutex_);
  auto node = streams_.extract(handle);
  if (node.empty()) { return std::nullopt; }
  return std::move(node.mapped());
}

auto relay_transport::handle(const protocol::event &frame) -> void
{
  auto handlers = find_handlers(frame.subscription_id);
  if (not handlers) {
    spdlog::trace("[relay_transport] EVENT for unknown stream {}", frame.subscription_id);
    return;
  }
  if (handlers->on_event) { handlers->on_event(frame.data); }
}

auto relay_transport::handle(const protocol::eose &frame) -> void
{
  auto handlers = find_handlers(frame.subscription_id);
  if (handlers and handlers->on_eose) { handlers->on_eose(); }
}

auto relay_transport::handle(const protocol::closed &frame) -> void
{
  auto handlers = take_handlers(frame.subscription_id);
  if (not handlers) { return; }

  spdlog::info("[relay_transport] Relay closed stream {}: {}", frame.subscription_id, frame.message);
  if (handlers->on_error) { handlers->on_error(frame.message.empty() ? "closed by relay" : frame.message); }
}

auto relay_transport::handle(const protocol::notice &frame) -> void
{
  spdlog::warn("[relay_transport] Relay notice: {}", frame.message);
}

}// namespace vine_sync::nostr
