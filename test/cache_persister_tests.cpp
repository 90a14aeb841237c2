#include <catch2/catch_test_macros.hpp>
#include <reconcile/event_reconciler.hpp>
#include <storage/cache_codec.hpp>
#include <storage/cache_persister.hpp>

#include "test_doubles/test_double_key_value_store.hpp"
#include "test_doubles/test_events.hpp"

#include <memory>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

using namespace vine_sync::reconcile;
using vine_sync::storage::cache_persister;
using vine_sync::storage::decode_collection;
using vine_sync::storage::encode_collection;
using vine_sync_test::TestDoubleKeyValueStore;

namespace {

auto reaction_item(const std::string &id, const std::string &target, std::uint64_t created_at) -> reconciled_item
{
  return reconciled_item{
    .key = id, .event = vine_sync_test::make_reaction(id, "me", target, created_at), .local_only = false
  };
}

/// Blob with the given number of valid and corrupt reaction records
auto mixed_blob(int valid, int corrupt) -> std::string
{
  std::vector<reconciled_item> items;
  for (int idx = 0; idx < valid; ++idx) {
    items.push_back(reaction_item("r" + std::to_string(idx), "video" + std::to_string(idx), 10));
  }
  auto blob = nlohmann::json::parse(encode_collection(items));
  for (int idx = 0; idx < corrupt; ++idx) { blob["items"].push_back({ { "key", "broken" }, { "event", 42 } }); }
  return blob.dump();
}

}// namespace

TEST_CASE("cache codec encodes the versioned record layout", "[storage][codec]")
{
  auto local = reaction_item("r1", "video1", 10);
  local.local_only = true;

  auto json = nlohmann::json::parse(encode_collection({ local }));
  CHECK(json["version"] == 1);
  REQUIRE(json["items"].size() == 1);
  CHECK(json["items"][0]["key"] == "r1");
  CHECK(json["items"][0]["local_only"] == true);
  CHECK(json["items"][0]["event"]["id"] == "r1");

  auto decoded = decode_collection(collection::reactions, json.dump());
  REQUIRE(decoded.has_value());
  CHECK(decoded->corrupt == 0);
  REQUIRE(decoded->items.size() == 1);
  CHECK(decoded->items[0] == local);
}

TEST_CASE("cache codec counts inconsistent records as corrupt", "[storage][codec]")
{
  auto wrong_key = reaction_item("r1", "video1", 10);
  wrong_key.key = "not_r1";

  auto wrong_collection = reconciled_item{
    .key = "3:me:", .event = vine_sync_test::make_contact_list("c1", "me", 10, {}), .local_only = false
  };

  auto decoded = decode_collection(collection::reactions,
    encode_collection({ reaction_item("r2", "video2", 10), wrong_key, wrong_collection }));

  REQUIRE(decoded.has_value());
  CHECK(decoded->items.size() == 1);
  CHECK(decoded->corrupt == 2);
}

TEST_CASE("cache codec rejects unreadable blobs", "[storage][codec]")
{
  CHECK_FALSE(decode_collection(collection::reactions, "{truncated").has_value());
  CHECK_FALSE(decode_collection(collection::reactions, R"({"version":2,"items":[]})").has_value());
  CHECK_FALSE(decode_collection(collection::reactions, R"({"version":1})").has_value());
  CHECK_FALSE(decode_collection(collection::reactions, "[]").has_value());
}

SCENARIO("cache_persister round-trips collections through the store", "[storage][persister]")
{
  GIVEN("A persister over an in-memory store")
  {
    auto store = std::make_shared<TestDoubleKeyValueStore>();
    cache_persister persister(store);

    WHEN("a collection is persisted")
    {
      REQUIRE(persister.persist(collection::reactions, { reaction_item("r1", "video1", 10) }));

      THEN("it is stored under the namespaced key")
      {
        CHECK(persister.key_for(collection::reactions) == "vine_sync.reactions");
        CHECK(store->data.contains("vine_sync.reactions"));
      }

      AND_WHEN("loaded into a fresh reconciler")
      {
        event_reconciler reconciler;
        auto report = persister.load_into(collection::reactions, reconciler);

        THEN("the items are restored")
        {
          CHECK(report.loaded == 1);
          CHECK(report.corrupt == 0);
          CHECK_FALSE(report.discarded);
          CHECK(reconciler.is_liked("video1"));
        }
      }
    }

    WHEN("nothing was persisted")
    {
      event_reconciler reconciler;
      auto reports = persister.load_all(reconciler);

      THEN("every collection loads empty")
      {
        CHECK(reports.size() == all_collections.size());
        for (const auto &[which, report] : reports) {
          CHECK(report.loaded == 0);
          CHECK_FALSE(report.discarded);
        }
      }
    }

    WHEN("the store rejects writes")
    {
      store->fail_writes = true;

      THEN("persist reports the failure") { CHECK_FALSE(persister.persist(collection::reactions, {})); }
    }
  }
}

TEST_CASE("cache_persister skips corrupt records below the threshold", "[storage][persister][corruption]")
{
  auto store = std::make_shared<TestDoubleKeyValueStore>();
  store->data["vine_sync.reactions"] = mixed_blob(3, 1);
  cache_persister persister(store);

  event_reconciler reconciler;
  auto report = persister.load_into(collection::reactions, reconciler);

  CHECK(report.loaded == 3);
  CHECK(report.corrupt == 1);
  CHECK_FALSE(report.discarded);
  CHECK(reconciler.size(collection::reactions) == 3);
  CHECK(store->data.contains("vine_sync.reactions"));
}

TEST_CASE("cache_persister keeps a blob at exactly the threshold", "[storage][persister][corruption]")
{
  auto store = std::make_shared<TestDoubleKeyValueStore>();
  store->data["vine_sync.reactions"] = mixed_blob(2, 2);
  cache_persister persister(store);

  event_reconciler reconciler;
  auto report = persister.load_into(collection::reactions, reconciler);

  CHECK_FALSE(report.discarded);
  CHECK(report.loaded == 2);
}

TEST_CASE("cache_persister discards a mostly corrupt blob", "[storage][persister][corruption]")
{
  auto store = std::make_shared<TestDoubleKeyValueStore>();
  store->data["vine_sync.reactions"] = mixed_blob(1, 2);
  cache_persister persister(store);

  event_reconciler reconciler;
  auto report = persister.load_into(collection::reactions, reconciler);

  CHECK(report.discarded);
  CHECK(report.loaded == 0);
  CHECK(reconciler.size(collection::reactions) == 0);
  CHECK_FALSE(store->data.contains("vine_sync.reactions"));
}

TEST_CASE("cache_persister discards an unreadable blob", "[storage][persister][corruption]")
{
  auto store = std::make_shared<TestDoubleKeyValueStore>();
  store->data["vine_sync.follow_sets"] = "\x01\x02 not json";
  cache_persister persister(store);

  event_reconciler reconciler;
  auto report = persister.load_into(collection::follow_sets, reconciler);

  CHECK(report.discarded);
  CHECK_FALSE(store->data.contains("vine_sync.follow_sets"));
}

TEST_CASE("cache_persister honours a custom namespace and threshold", "[storage][persister]")
{
  auto store = std::make_shared<TestDoubleKeyValueStore>();
  store->data["alice.reactions"] = mixed_blob(3, 1);
  cache_persister persister(store, "alice", 0.2);

  event_reconciler reconciler;
  auto report = persister.load_into(collection::reactions, reconciler);

  CHECK(report.discarded);
  CHECK(persister.key_for(collection::deletions) == "alice.deletions");
}

TEST_CASE("cache_persister validates its parameters", "[storage][persister]")
{
  auto store = std::make_shared<TestDoubleKeyValueStore>();
  CHECK_THROWS_AS(cache_persister<TestDoubleKeyValueStore>(nullptr), std::invalid_argument);
  CHECK_THROWS_AS(cache_persister(store, ""), std::invalid_argument);
  CHECK_THROWS_AS(cache_persister(store, "ns", 1.5), std::invalid_argument);
}

TEST_CASE("cache_persister clear_all erases every collection", "[storage][persister]")
{
  auto store = std::make_shared<TestDoubleKeyValueStore>();
  cache_persister persister(store);
  for (const auto which : all_collections) { REQUIRE(persister.persist(which, {})); }
  store->data["unrelated"] = "keep";

  persister.clear_all();

  CHECK(store->data.size() == 1);
  CHECK(store->data.contains("unrelated"));
}
