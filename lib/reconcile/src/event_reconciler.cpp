#include <reconcile/event_reconciler.hpp>
#include <reconcile/logical_key.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <utility>

namespace vine_sync::reconcile {

namespace {

  auto to_reconcile_outcome(merge_outcome outcome) -> reconcile_outcome
  {
    switch (outcome) {
    case merge_outcome::inserted:
      return reconcile_outcome::inserted;
    case merge_outcome::replaced:
      return reconcile_outcome::replaced;
    case merge_outcome::confirmed:
      return reconcile_outcome::confirmed;
    case merge_outcome::duplicate:
      return reconcile_outcome::duplicate;
    case merge_outcome::stale:
      return reconcile_outcome::stale;
    }
    return reconcile_outcome::stale;
  }

  /// Target of a reaction is the last "e" tag (NIP-25)
  auto reaction_target(const nostr::protocol::event_data &reaction) -> std::optional<std::string>
  {
    auto targets = reaction.tag_values("e");
    if (targets.empty()) { return std::nullopt; }
    return targets.back();
  }

  auto is_positive_reaction(const nostr::protocol::event_data &reaction) -> bool { return reaction.content != "-"; }

  auto has_required_tags(collection which, const nostr::protocol::event_data &event) -> bool
  {
    switch (which) {
    case collection::reactions:
      return event.first_tag_value("e").has_value();
    case collection::reposts:
    case collection::deletions:
      return event.first_tag_value("a").has_value() or event.first_tag_value("e").has_value();
    case collection::contact_lists:
    case collection::follow_sets:
    case collection::curation_sets:
      return true;
    }
    return false;
  }

  /// Pubkey segment of a "kind:pubkey:d-tag" address
  auto address_author(const std::string &address) -> std::optional<std::string>
  {
    const auto first = address.find(':');
    if (first == std::string::npos) { return std::nullopt; }
    const auto second = address.find(':', first + 1);
    if (second == std::string::npos) { return std::nullopt; }
    return address.substr(first + 1, second - first - 1);
  }

  auto references(const nostr::protocol::event_data &event, const std::string &target) -> bool
  {
    return std::ranges::any_of(event.tags,
      [&target](const auto &tag) { return tag.size() > 1 and (tag[0] == "a" or tag[0] == "e") and tag[1] == target; });
  }

}// namespace

auto to_string(reconcile_outcome outcome) -> std::string_view
{
  switch (outcome) {
  case reconcile_outcome::inserted:
    return "inserted";
  case reconcile_outcome::replaced:
    return "replaced";
  case reconcile_outcome::confirmed:
    return "confirmed";
  case reconcile_outcome::duplicate:
    return "duplicate";
  case reconcile_outcome::stale:
    return "stale";
  case reconcile_outcome::deleted:
    return "deleted";
  case reconcile_outcome::malformed:
    return "malformed";
  case reconcile_outcome::ignored:
    return "ignored";
  }
  return "unknown";
}

event_reconciler::event_reconciler(persist_fn persist) : persist_(std::move(persist)) {}

auto event_reconciler::set_persist_hook(persist_fn persist) -> void
{
  const std::scoped_lock lock(mutex_);
  persist_ = std::move(persist);
}

auto event_reconciler::reconcile(const nostr::protocol::event_data &event, item_origin origin) -> reconcile_outcome
{
  auto result = reconcile_batch({ event }, origin);
  for (const auto &[outcome, count] : result.counts) {
    if (count > 0) { return outcome; }
  }
  return reconcile_outcome::ignored;
}

auto event_reconciler::reconcile_batch(const std::vector<nostr::protocol::event_data> &events, item_origin origin)
  -> batch_result
{
  batch_result result;
  persist_fn hook;
  std::vector<pending_snapshot> snapshots;
  {
    const std::scoped_lock lock(mutex_);
    for (const auto &event : events) {
      auto outcome = reconcile_locked(event, origin == item_origin::local, result);
      ++result.counts[outcome];
    }

    // Snapshots are taken under the merge lock; generations order their writes.
    if (persist_ and not result.mutated.empty()) {
      hook = persist_;
      for (const auto which : result.mutated) {
        snapshots.push_back(
          pending_snapshot{ .which = which, .generation = ++generations_[which], .items = store(which).snapshot() });
      }
    }
  }

  if (hook) { persist(hook, snapshots); }
  return result;
}

auto event_reconciler::restore(const std::vector<reconciled_item> &items) -> batch_result
{
  batch_result result;
  const std::scoped_lock lock(mutex_);
  for (const auto &item : items) {
    auto outcome = reconcile_locked(item.event, item.local_only, result);
    ++result.counts[outcome];
  }
  return result;
}

auto event_reconciler::reconcile_locked(const nostr::protocol::event_data &event,
  bool local_only,
  batch_result &result) -> reconcile_outcome
{
  auto which = collection_for(event.kind);
  if (not which) { return reconcile_outcome::ignored; }

  if (event.id.empty() or event.pubkey.empty() or not has_required_tags(*which, event)) {
    spdlog::debug("[event_reconciler] Discarding malformed kind {} event {}", event.kind, event.id);
    return reconcile_outcome::malformed;
  }

  auto key = logical_key(event);
  if (not key) {
    spdlog::debug("[event_reconciler] Discarding kind {} event {} without logical key", event.kind, event.id);
    return reconcile_outcome::malformed;
  }

  if (is_deleted(*which, *key, event)) { return reconcile_outcome::deleted; }

  auto merged = store(*which).merge(reconciled_item{ .key = *key, .event = event, .local_only = local_only });
  auto outcome = to_reconcile_outcome(merged);

  if (is_mutation(outcome)) {
    result.mutated.insert(*which);
    spdlog::trace("[event_reconciler] {} {} in {}", to_string(outcome), *key, to_string(*which));
  }

  if (*which == collection::deletions and outcome == reconcile_outcome::inserted) { apply_deletion(event, result); }

  return outcome;
}

auto event_reconciler::is_deleted(collection which,
  const std::string &key,
  const nostr::protocol::event_data &event) const -> bool
{
  if (which == collection::deletions) { return false; }

  if (deleted_event_ids_.contains({ event.id, event.pubkey })) { return true; }

  if (auto iter = deleted_addresses_.find(key); iter != deleted_addresses_.end()
                                                and iter->second.pubkey == event.pubkey
                                                and event.created_at <= iter->second.deleted_at) {
    return true;
  }

  return false;
}

auto event_reconciler::apply_deletion(const nostr::protocol::event_data &deletion, batch_result &result) -> void
{
  for (const auto &event_id : deletion.tag_values("e")) {
    deleted_event_ids_.emplace(event_id, deletion.pubkey);

    for (auto &[which, items] : stores_) {
      if (which == collection::deletions) { continue; }
      const auto &all = items.items();
      auto iter = std::ranges::find_if(all, [&](const auto &entry) {
        return entry.second.event.id == event_id and entry.second.event.pubkey == deletion.pubkey;
      });
      if (iter != all.end()) {
        spdlog::debug("[event_reconciler] Deletion {} removes {} from {}", deletion.id, event_id, to_string(which));
        const auto key = iter->first;
        items.erase(key);
        result.mutated.insert(which);
      }
    }
  }

  for (const auto &address : deletion.tag_values("a")) {
    // Only the author of an address may delete it
    if (address_author(address) != deletion.pubkey) {
      spdlog::debug("[event_reconciler] Deletion {} ignores foreign address {}", deletion.id, address);
      continue;
    }

    auto &tombstone = deleted_addresses_[address];
    tombstone.pubkey = deletion.pubkey;
    tombstone.deleted_at = std::max(tombstone.deleted_at, deletion.created_at);

    for (auto &[which, items] : stores_) {
      if (which == collection::deletions) { continue; }
      const auto *existing = items.find(address);
      if (existing != nullptr and existing->event.pubkey == deletion.pubkey
          and existing->created_at() <= deletion.created_at) {
        spdlog::debug("[event_reconciler] Deletion {} removes {} from {}", deletion.id, address, to_string(which));
        items.erase(address);
        result.mutated.insert(which);
      }
    }
  }
}

auto event_reconciler::persist(const persist_fn &hook, std::vector<pending_snapshot> &snapshots) -> void
{
  const std::scoped_lock lock(persist_mutex_);
  for (auto &snapshot : snapshots) {
    auto &written = persisted_generations_[snapshot.which];
    if (snapshot.generation <= written) {
      spdlog::debug("[event_reconciler] Skipping stale snapshot of {}", to_string(snapshot.which));
      continue;
    }

    try {
      hook(snapshot.which, std::move(snapshot.items));
      written = snapshot.generation;
    } catch (const std::exception &e) {
      spdlog::error("[event_reconciler] Failed to persist {}: {}", to_string(snapshot.which), e.what());
    }
  }
}

auto event_reconciler::liked_event_ids() const -> std::set<std::string>
{
  const std::scoped_lock lock(mutex_);
  std::set<std::string> liked;
  auto iter = stores_.find(collection::reactions);
  if (iter == stores_.end()) { return liked; }

  for (const auto &[key, item] : iter->second.items()) {
    if (not is_positive_reaction(item.event)) { continue; }
    if (auto target = reaction_target(item.event)) { liked.insert(*target); }
  }
  return liked;
}

auto event_reconciler::is_liked(const std::string &event_id) const -> bool
{
  return reaction_id_for(event_id).has_value();
}

auto event_reconciler::reaction_id_for(const std::string &event_id) const -> std::optional<std::string>
{
  const std::scoped_lock lock(mutex_);
  auto iter = stores_.find(collection::reactions);
  if (iter == stores_.end()) { return std::nullopt; }

  const reconciled_item *latest = nullptr;
  for (const auto &[key, item] : iter->second.items()) {
    if (not is_positive_reaction(item.event) or reaction_target(item.event) != event_id) { continue; }
    if (latest == nullptr or item.created_at() > latest->created_at()) { latest = &item; }
  }
  if (latest == nullptr) { return std::nullopt; }
  return latest->event.id;
}

auto event_reconciler::has_reposted(const std::string &target) const -> bool
{
  return repost_id_for(target).has_value();
}

auto event_reconciler::repost_id_for(const std::string &target) const -> std::optional<std::string>
{
  const std::scoped_lock lock(mutex_);
  auto iter = stores_.find(collection::reposts);
  if (iter == stores_.end()) { return std::nullopt; }

  const reconciled_item *latest = nullptr;
  for (const auto &[key, item] : iter->second.items()) {
    if (not references(item.event, target)) { continue; }
    if (latest == nullptr or item.created_at() > latest->created_at()) { latest = &item; }
  }
  if (latest == nullptr) { return std::nullopt; }
  return latest->event.id;
}

auto event_reconciler::following(const std::string &pubkey) const -> std::vector<std::string>
{
  const std::scoped_lock lock(mutex_);
  auto iter = stores_.find(collection::contact_lists);
  if (iter == stores_.end()) { return {}; }

  const auto *contact_list =
    iter->second.find(make_address(nostr::protocol::to_number(nostr::protocol::kind::contact_list), pubkey, ""));
  if (contact_list == nullptr) { return {}; }
  return contact_list->event.tag_values("p");
}

auto event_reconciler::is_following(const std::string &pubkey, const std::string &target) const -> bool
{
  auto followed = following(pubkey);
  return std::ranges::find(followed, target) != followed.end();
}

auto event_reconciler::follow_sets(const std::string &pubkey) const -> std::vector<follow_set>
{
  const std::scoped_lock lock(mutex_);
  std::vector<follow_set> sets;
  auto iter = stores_.find(collection::follow_sets);
  if (iter == stores_.end()) { return sets; }

  for (const auto &[key, item] : iter->second.items()) {
    if (item.event.pubkey != pubkey) { continue; }
    if (auto set = follow_set::from_event(item.event)) { sets.push_back(std::move(*set)); }
  }
  std::ranges::sort(sets, std::ranges::greater{}, &follow_set::created_at);
  return sets;
}

auto event_reconciler::curated_lists(const std::string &pubkey) const -> std::vector<curated_list>
{
  const std::scoped_lock lock(mutex_);
  std::vector<curated_list> lists;
  auto iter = stores_.find(collection::curation_sets);
  if (iter == stores_.end()) { return lists; }

  for (const auto &[key, item] : iter->second.items()) {
    if (item.event.pubkey != pubkey) { continue; }
    if (auto list = curated_list::from_event(item.event)) { lists.push_back(std::move(*list)); }
  }
  std::ranges::sort(lists, std::ranges::greater{}, &curated_list::created_at);
  return lists;
}

auto event_reconciler::snapshot(collection which) const -> std::vector<reconciled_item>
{
  const std::scoped_lock lock(mutex_);
  auto iter = stores_.find(which);
  if (iter == stores_.end()) { return {}; }
  return iter->second.snapshot();
}

auto event_reconciler::size(collection which) const -> std::size_t
{
  const std::scoped_lock lock(mutex_);
  auto iter = stores_.find(which);
  return iter == stores_.end() ? 0 : iter->second.size();
}

auto event_reconciler::clear() -> void
{
  const std::scoped_lock lock(mutex_);
  stores_.clear();
  deleted_event_ids_.clear();
  deleted_addresses_.clear();
}

}// namespace vine_sync::reconcile
