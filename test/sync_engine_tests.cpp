#include <catch2/catch_test_macros.hpp>
#include <engine/sync_engine.hpp>
#include <storage/cache_codec.hpp>

#include "test_doubles/test_double_key_value_store.hpp"
#include "test_doubles/test_double_subscription_transport.hpp"
#include "test_doubles/test_events.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <tuple>
#include <vector>

using namespace std::chrono_literals;
using namespace vine_sync::reconcile;
using vine_sync_test::TestDoubleKeyValueStore;
using vine_sync_test::TestDoubleSubscriptionTransport;

using engine_t = vine_sync::engine::sync_engine<TestDoubleSubscriptionTransport, TestDoubleKeyValueStore>;

namespace {

struct engine_fixture
{
  std::shared_ptr<boost::asio::io_context> io_context = std::make_shared<boost::asio::io_context>();
  std::shared_ptr<TestDoubleSubscriptionTransport> transport = std::make_shared<TestDoubleSubscriptionTransport>();
  std::shared_ptr<TestDoubleKeyValueStore> store = std::make_shared<TestDoubleKeyValueStore>();

  auto make_engine(vine_sync::engine::sync_engine_options options = {}) -> std::unique_ptr<engine_t>
  {
    return std::make_unique<engine_t>(transport, store, io_context, "me", std::move(options));
  }

  /// Runs one reconciliation pass over whatever is queued
  auto reconcile_pending(engine_t &engine) -> void
  {
    boost::asio::co_spawn(*io_context, engine.run_once(), boost::asio::detached);
    io_context->run_for(50ms);
    io_context->restart();
  }

  auto handle_for(std::uint32_t kind) const -> std::string
  {
    auto handle = transport->handle_for_kind(kind);
    REQUIRE(handle.has_value());
    return *handle;
  }
};

}// namespace

SCENARIO("sync_engine opens the personal subscriptions on start", "[engine]")
{
  GIVEN("An engine for user me")
  {
    engine_fixture fixture;
    auto engine = fixture.make_engine();

    WHEN("started")
    {
      engine->start();

      THEN("one subscription per personal collection is open")
      {
        CHECK(engine->personal_subscription_ids().size() == 6);
        CHECK(engine->manager()->active_count() == 6);
        CHECK(fixture.transport->subscribe_calls.size() == 6);

        for (const auto &call : fixture.transport->subscribe_calls) {
          REQUIRE(call.filters.size() == 1);
          CHECK(call.filters[0].authors == std::vector<std::string>{ "me" });
        }
      }

      THEN("the contact list is fetched with highest personal priority and limit 1")
      {
        auto stats = engine->manager()->get_stats();
        bool found = false;
        for (const auto &details : stats.subscriptions) {
          if (details.name == "personal_contact_list") {
            found = true;
            CHECK(details.priority == 2);
          }
        }
        CHECK(found);

        auto handle = fixture.handle_for(3);
        for (const auto &call : fixture.transport->subscribe_calls) {
          if (call.handle == handle) { CHECK(call.filters[0].limit == 1U); }
        }
      }
    }
  }
}

SCENARIO("sync_engine reconciles delivered events and persists them", "[engine]")
{
  GIVEN("A started engine")
  {
    engine_fixture fixture;
    auto engine = fixture.make_engine();
    engine->start();

    WHEN("the reactions stream delivers a like")
    {
      fixture.transport->emit_event(fixture.handle_for(7), vine_sync_test::make_reaction("r1", "me", "video1", 10));

      THEN("it is queued until the run loop reconciles it")
      {
        CHECK(engine->pending_events() == 1);
        CHECK_FALSE(engine->reconciler()->is_liked("video1"));

        fixture.reconcile_pending(*engine);

        CHECK(engine->pending_events() == 0);
        CHECK(engine->reconciler()->is_liked("video1"));
        CHECK(fixture.store->data.contains("vine_sync.reactions"));
      }
    }

    WHEN("several events are queued")
    {
      fixture.transport->emit_event(fixture.handle_for(3), vine_sync_test::make_contact_list("c1", "me", 10, { "bob" }));
      fixture.transport->emit_event(
        fixture.handle_for(3), vine_sync_test::make_contact_list("c2", "me", 20, { "carol" }));
      fixture.transport->emit_event(
        fixture.handle_for(16), vine_sync_test::make_repost("rp1", "me", "34236:author:clip", 15));

      fixture.reconcile_pending(*engine);

      THEN("one pass reconciles them all")
      {
        CHECK(engine->pending_events() == 0);
        CHECK(engine->reconciler()->following("me") == std::vector<std::string>{ "carol" });
        CHECK(engine->reconciler()->has_reposted("34236:author:clip"));
      }
    }
  }
}

TEST_CASE("sync_engine restores the cache before subscribing", "[engine][cache]")
{
  engine_fixture fixture;
  fixture.store->data["vine_sync.reactions"] = vine_sync::storage::encode_collection({ reconciled_item{
    .key = "r1", .event = vine_sync_test::make_reaction("r1", "me", "video1", 10), .local_only = false } });
  fixture.store->data["vine_sync.follow_sets"] = "garbage";

  auto engine = fixture.make_engine();
  auto reports = engine->start();

  CHECK(reports[collection::reactions].loaded == 1);
  CHECK(reports[collection::follow_sets].discarded);
  CHECK(engine->reconciler()->is_liked("video1"));
  CHECK_FALSE(fixture.store->data.contains("vine_sync.follow_sets"));
}

TEST_CASE("sync_engine forwards application subscriptions", "[engine]")
{
  engine_fixture fixture;
  auto engine = fixture.make_engine();

  std::vector<std::string> forwarded;
  vine_sync::subscription::subscription_request request;
  request.name = "video_reactions";
  request.filters = { vine_sync::nostr::protocol::filter{} };
  request.on_event = [&forwarded](const vine_sync::nostr::protocol::event_data &event) {
    forwarded.push_back(event.id);
  };
  auto subscription_id = engine->subscribe(request);

  fixture.transport->emit_event(fixture.transport->last_handle(), vine_sync_test::make_reaction("r9", "me", "v9", 1));
  fixture.reconcile_pending(*engine);

  CHECK(engine->manager()->is_active(subscription_id));
  CHECK(forwarded == std::vector<std::string>{ "r9" });
  CHECK(engine->reconciler()->is_liked("v9"));
}

TEST_CASE("sync_engine sizes the inbound queue to hold a minute of admitted events", "[engine][backpressure]")
{
  engine_fixture fixture;
  vine_sync::engine::sync_engine_options options;
  options.subscriptions.max_events_per_minute = 3;
  options.queue_capacity = 1;
  auto engine = fixture.make_engine(options);
  engine->start();

  auto handle = fixture.handle_for(7);
  for (int index = 1; index <= 4; ++index) {
    fixture.transport->emit_event(handle,
      vine_sync_test::make_reaction(
        "r" + std::to_string(index), "me", "v" + std::to_string(index), static_cast<std::uint64_t>(index)));
  }

  CHECK(engine->pending_events() == 3);
  CHECK(engine->dropped_events() == 0);
  CHECK(engine->manager()->get_stats().dropped_events == 1);

  fixture.reconcile_pending(*engine);
  CHECK(engine->reconciler()->size(collection::reactions) == 3);
}

TEST_CASE("sync_engine personal subscriptions outlive the default timeout", "[engine][timeout]")
{
  engine_fixture fixture;
  vine_sync::engine::sync_engine_options options;
  options.subscriptions.default_timeout = 10ms;
  auto engine = fixture.make_engine(options);
  engine->start();

  fixture.io_context->run_for(100ms);
  fixture.io_context->restart();

  CHECK(engine->manager()->active_count() == 6);
  CHECK(engine->personal_subscription_ids().size() == 6);
}

TEST_CASE("sync_engine tracks personal subscriptions across retries", "[engine][retry]")
{
  engine_fixture fixture;
  vine_sync::engine::sync_engine_options options;
  options.subscriptions.retry_delay = 10ms;
  auto engine = fixture.make_engine(options);
  engine->start();

  auto before = engine->personal_subscription_ids();
  REQUIRE(before.size() == 6);

  fixture.transport->emit_error(fixture.handle_for(7), "relay dropped");
  CHECK(engine->personal_subscription_ids().size() == 5);

  fixture.io_context->run_for(100ms);
  fixture.io_context->restart();

  auto after = engine->personal_subscription_ids();
  CHECK(after.size() == 6);
  CHECK(engine->manager()->active_count() == 6);
  CHECK(std::ranges::count_if(after, [&before](const auto &id) { return std::ranges::find(before, id) == before.end(); })
        == 1);

  fixture.transport->emit_event(fixture.handle_for(7), vine_sync_test::make_reaction("r1", "me", "video1", 10));
  fixture.reconcile_pending(*engine);
  CHECK(engine->reconciler()->is_liked("video1"));
}

TEST_CASE("sync_engine records local writes", "[engine][local]")
{
  engine_fixture fixture;
  auto engine = fixture.make_engine();

  CHECK(engine->add_local(vine_sync_test::make_reaction("r1", "me", "v1", 1)) == reconcile_outcome::inserted);
  CHECK(engine->reconciler()->is_liked("v1"));

  auto stored = vine_sync::storage::decode_collection(collection::reactions, fixture.store->data["vine_sync.reactions"]);
  REQUIRE(stored.has_value());
  REQUIRE(stored->items.size() == 1);
  CHECK(stored->items[0].local_only);
}

TEST_CASE("sync_engine run loop exits when stopped", "[engine][shutdown]")
{
  engine_fixture fixture;
  auto engine = fixture.make_engine();
  engine->start();

  auto finished = std::make_shared<bool>(false);
  boost::asio::co_spawn(
    *fixture.io_context,
    [](engine_t &running, std::shared_ptr<bool> done) -> boost::asio::awaitable<void> {
      co_await running.run();
      *done = true;
    }(*engine, finished),
    boost::asio::detached);

  fixture.io_context->run_for(20ms);
  REQUIRE_FALSE(*finished);

  engine->stop();
  fixture.io_context->restart();
  fixture.io_context->run_for(50ms);

  CHECK(*finished);
  CHECK(engine->manager()->active_count() == 0);
  CHECK(fixture.transport->open_count() == 0);
}

TEST_CASE("sync_engine reset_cache clears the store and state", "[engine][cache]")
{
  engine_fixture fixture;
  auto engine = fixture.make_engine();
  std::ignore = engine->add_local(vine_sync_test::make_reaction("r1", "me", "v1", 1));
  REQUIRE(fixture.store->data.contains("vine_sync.reactions"));

  engine->reset_cache();

  CHECK(fixture.store->data.empty());
  CHECK_FALSE(engine->reconciler()->is_liked("v1"));
}

TEST_CASE("sync_engine keeps running after an event that cannot be encoded as UTF-8", "[engine][cache]")
{
  engine_fixture fixture;
  auto engine = fixture.make_engine();
  engine->start();

  auto handle = fixture.handle_for(7);
  fixture.transport->emit_event(handle, vine_sync_test::make_reaction("r1", "me", "video1", 10, "\xff\xfe"));
  fixture.reconcile_pending(*engine);
  fixture.transport->emit_event(handle, vine_sync_test::make_reaction("r2", "me", "video2", 11));
  fixture.reconcile_pending(*engine);

  CHECK(engine->reconciler()->is_liked("video2"));
  auto stored = vine_sync::storage::decode_collection(collection::reactions, fixture.store->data["vine_sync.reactions"]);
  REQUIRE(stored.has_value());
  CHECK(stored->items.size() == 2);
  CHECK(stored->corrupt == 0);
}

TEST_CASE("sync_engine requires a user pubkey", "[engine]")
{
  engine_fixture fixture;
  CHECK_THROWS_AS(engine_t(fixture.transport, fixture.store, fixture.io_context, ""), std::invalid_argument);
}
