#pragma once

#include <concepts/key_value_store.hpp>
#include <reconcile/collections.hpp>
#include <reconcile/event_reconciler.hpp>
#include <storage/cache_codec.hpp>

#include <spdlog/spdlog.h>

#include <cstddef>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace vine_sync::storage {

inline constexpr double default_corruption_threshold = 0.5;
inline constexpr auto default_cache_namespace = "vine_sync";

/// Outcome of loading one collection from the cache
struct load_report
{
  std::size_t loaded{};///< Records handed to the reconciler
  std::size_t corrupt{};///< Records skipped
  bool discarded{ false };///< Blob erased; rebuild from the live source
};

/**
 * @brief Persists reconciled collections to a key-value store, one blob each.
 *
 * @tparam Store Type satisfying the key_value_store concept
 */
template<concepts::key_value_store Store> class cache_persister
{
public:
  /**
   * @brief Constructs a persister.
   *
   * @param store Backing store
   * @param key_namespace Prefix of every blob key
   * @param corruption_threshold Corrupt fraction above which a blob is discarded, in [0, 1]
   */
  explicit cache_persister(std::shared_ptr<Store> store,
    std::string key_namespace = default_cache_namespace,
    double corruption_threshold = default_corruption_threshold)
    : store_(std::move(store)), namespace_(std::move(key_namespace)), corruption_threshold_(corruption_threshold)
  {
    if (not store_) { throw std::invalid_argument("cache_persister requires a store"); }
    if (namespace_.empty()) { throw std::invalid_argument("cache namespace must not be empty"); }
    if (corruption_threshold_ < 0.0 or corruption_threshold_ > 1.0) {
      throw std::invalid_argument("corruption threshold must be within [0, 1]");
    }
  }

  [[nodiscard]] auto key_for(reconcile::collection which) const -> std::string
  {
    return namespace_ + "." + std::string(reconcile::to_string(which));
  }

  /**
   * @brief Writes the full contents of a collection.
   *
   * @return false if the store rejected the write
   */
  auto persist(reconcile::collection which, const std::vector<reconcile::reconciled_item> &items) -> bool
  {
    if (not store_->put(key_for(which), encode_collection(items))) {
      spdlog::error("[cache_persister] Failed to persist {} ({} items)", reconcile::to_string(which), items.size());
      return false;
    }
    spdlog::trace("[cache_persister] Persisted {} ({} items)", reconcile::to_string(which), items.size());
    return true;
  }

  /**
   * @brief Loads one collection and feeds it through the reconciler.
   *
   * Cached items pass the same last-writer-wins comparison as live events, so
   * anything newer already in the reconciler is kept.
   */
  auto load_into(reconcile::collection which, reconcile::event_reconciler &reconciler) -> load_report
  {
    load_report report;
    const auto key = key_for(which);

    auto blob = store_->get(key);
    if (not blob) { return report; }

    auto decoded = decode_collection(which, *blob);
    if (not decoded) {
      spdlog::warn("[cache_persister] Discarding unreadable cache blob {}", key);
      discard(key);
      report.discarded = true;
      return report;
    }

    report.corrupt = decoded->corrupt;
    if (decoded->total() > 0) {
      const auto corrupt_ratio = static_cast<double>(decoded->corrupt) / static_cast<double>(decoded->total());
      if (corrupt_ratio > corruption_threshold_) {
        spdlog::warn("[cache_persister] Discarding {}: {} of {} records corrupt", key, decoded->corrupt, decoded->total());
        discard(key);
        report.discarded = true;
        return report;
      }
    }

    if (decoded->corrupt > 0) {
      spdlog::warn("[cache_persister] Skipped {} corrupt records in {}", decoded->corrupt, key);
    }

    reconciler.restore(decoded->items);
    report.loaded = decoded->items.size();
    spdlog::info("[cache_persister] Loaded {} {} from cache", report.loaded, reconcile::to_string(which));
    return report;
  }

  /**
   * @brief Loads every collection, deletions first.
   */
  auto load_all(reconcile::event_reconciler &reconciler) -> std::map<reconcile::collection, load_report>
  {
    std::map<reconcile::collection, load_report> reports;
    for (const auto which : reconcile::all_collections) { reports[which] = load_into(which, reconciler); }
    return reports;
  }

  /**
   * @brief Erases every collection blob.
   */
  auto clear_all() -> void
  {
    for (const auto which : reconcile::all_collections) { store_->erase(key_for(which)); }
    spdlog::info("[cache_persister] Cleared cache namespace {}", namespace_);
  }

private:
  auto discard(const std::string &key) -> void
  {
    if (not store_->erase(key)) { spdlog::warn("[cache_persister] Could not erase {}", key); }
  }

  std::shared_ptr<Store> store_;
  std::string namespace_;
  double corruption_threshold_;
};

}// namespace vine_sync::storage
