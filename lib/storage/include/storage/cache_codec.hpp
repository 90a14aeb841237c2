#pragma once

#include <reconcile/collections.hpp>
#include <reconcile/reconciled_store.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace vine_sync::storage {

/// Current on-disk layout version
inline constexpr int cache_format_version = 1;

/// Records recovered from one collection blob
struct decoded_collection
{
  std::vector<reconcile::reconciled_item> items;
  std::size_t corrupt{};///< Records skipped as unreadable or inconsistent

  [[nodiscard]] auto total() const -> std::size_t { return items.size() + corrupt; }
};

/**
 * @brief Encodes a collection as {"version":1,"items":[{key,local_only,event}]}.
 */
[[nodiscard]] auto encode_collection(const std::vector<reconcile::reconciled_item> &items) -> std::string;

/**
 * @brief Decodes a collection blob record by record.
 *
 * A record is corrupt when it is not an object, its event does not parse, the
 * event kind belongs to another collection, or the stored key differs from the
 * key recomputed from the event. Corrupt records are counted and skipped.
 *
 * @return Decoded records, or std::nullopt if the blob itself is unreadable
 *         (invalid JSON, missing item list, unknown version)
 */
[[nodiscard]] auto decode_collection(reconcile::collection which, const std::string &blob)
  -> std::optional<decoded_collection>;

}// namespace vine_sync::storage
