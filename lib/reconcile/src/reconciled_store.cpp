#include <reconcile/reconciled_store.hpp>

#include <algorithm>

namespace vine_sync::reconcile {

auto reconciled_store::merge(reconciled_item item) -> merge_outcome
{
  auto iter = items_.find(item.key);
  if (iter == items_.end()) {
    auto key = item.key;
    items_.emplace(std::move(key), std::move(item));
    return merge_outcome::inserted;
  }

  auto &existing = iter->second;
  if (item.created_at() > existing.created_at()) {
    existing = std::move(item);
    return merge_outcome::replaced;
  }

  if (item.event.id == existing.event.id) {
    if (existing.local_only and not item.local_only) {
      existing.local_only = false;
      return merge_outcome::confirmed;
    }
    return merge_outcome::duplicate;
  }
  return merge_outcome::stale;
}

auto reconciled_store::erase(const std::string &key) -> bool { return items_.erase(key) > 0; }

auto reconciled_store::find(const std::string &key) const -> const reconciled_item *
{
  auto iter = items_.find(key);
  return iter == items_.end() ? nullptr : &iter->second;
}

auto reconciled_store::snapshot() const -> std::vector<reconciled_item>
{
  std::vector<reconciled_item> items;
  items.reserve(items_.size());
  for (const auto &[key, item] : items_) { items.push_back(item); }
  std::ranges::sort(items, {}, &reconciled_item::key);
  return items;
}

}// namespace vine_sync::reconcile
