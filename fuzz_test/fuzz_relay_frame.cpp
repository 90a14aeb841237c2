#include <async/async_queue.hpp>
#include <boost/asio/io_context.hpp>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <nostr/protocol.hpp>
#include <nostr/relay_transport.hpp>
#include <string>
#include <tuple>

// Fuzzer that feeds arbitrary inbound relay frames through the NIP-01 parser and the relay transport
// cppcheck-suppress unusedFunction symbolName=LLVMFuzzerTestOneInput
// NOLINTNEXTLINE(readability-identifier-naming)
extern "C" auto LLVMFuzzerTestOneInput(const uint8_t *Data, size_t Size) -> int
{
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  const std::string input(reinterpret_cast<const char *>(Data), Size);

  std::ignore = vine_sync::nostr::protocol::parse_relay_frame(input);

  auto io_context = std::make_shared<boost::asio::io_context>();
  auto outbound = std::make_shared<vine_sync::nostr::relay_transport::frame_queue_t>(io_context);
  vine_sync::nostr::relay_transport transport(outbound);

  std::ignore = transport.subscribe({ vine_sync::nostr::protocol::filter{} }, vine_sync::nostr::stream_handlers{});
  transport.handle_frame(input);
  transport.handle_disconnect("fuzz");

  return 0;
}
