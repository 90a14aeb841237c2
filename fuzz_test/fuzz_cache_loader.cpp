#include <cstddef>
#include <cstdint>
#include <reconcile/collections.hpp>
#include <storage/cache_codec.hpp>
#include <string>
#include <tuple>

// Fuzzer that decodes arbitrary cache blobs for every collection
// cppcheck-suppress unusedFunction symbolName=LLVMFuzzerTestOneInput
// NOLINTNEXTLINE(readability-identifier-naming)
extern "C" auto LLVMFuzzerTestOneInput(const uint8_t *Data, size_t Size) -> int
{
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  const std::string input(reinterpret_cast<const char *>(Data), Size);

  for (const auto which : vine_sync::reconcile::all_collections) {
    std::ignore = vine_sync::storage::decode_collection(which, input);
  }

  return 0;
}
