#include <catch2/catch_test_macros.hpp>
#include <concepts/key_value_store.hpp>
#include <storage/file_store.hpp>

#include <core/id_generator.hpp>

#include <filesystem>
#include <string>
#include <system_error>

using vine_sync::storage::file_store;

static_assert(vine_sync::concepts::key_value_store<file_store>);

namespace {

struct temp_directory
{
  std::filesystem::path path{ std::filesystem::temp_directory_path()
                              / ("vine_sync_test_" + vine_sync::core::id_generator::random_hex()) };

  temp_directory() = default;
  temp_directory(const temp_directory &) = delete;
  auto operator=(const temp_directory &) -> temp_directory & = delete;
  temp_directory(temp_directory &&) = delete;
  auto operator=(temp_directory &&) -> temp_directory & = delete;

  ~temp_directory()
  {
    std::error_code error;
    std::filesystem::remove_all(path, error);
  }
};

}// namespace

SCENARIO("file_store keeps one file per key", "[storage][file_store]")
{
  GIVEN("A store over a directory that does not exist yet")
  {
    const temp_directory dir;
    file_store store(dir.path / "cache");

    THEN("missing keys read as empty") { CHECK_FALSE(store.get("vine_sync.reactions").has_value()); }

    WHEN("a value is written")
    {
      REQUIRE(store.put("vine_sync.reactions", R"({"version":1,"items":[]})"));

      THEN("it can be read back from its own file")
      {
        CHECK(store.get("vine_sync.reactions") == R"({"version":1,"items":[]})");
        CHECK(std::filesystem::exists(dir.path / "cache" / "vine_sync.reactions"));
        CHECK_FALSE(std::filesystem::exists(dir.path / "cache" / "vine_sync.reactions.tmp"));
      }

      AND_WHEN("it is overwritten")
      {
        REQUIRE(store.put("vine_sync.reactions", "second"));

        THEN("the new value is returned") { CHECK(store.get("vine_sync.reactions") == "second"); }
      }

      AND_WHEN("it is erased")
      {
        CHECK(store.erase("vine_sync.reactions"));

        THEN("it is gone")
        {
          CHECK_FALSE(store.get("vine_sync.reactions").has_value());
          CHECK_FALSE(store.erase("vine_sync.reactions"));
        }
      }
    }
  }
}

TEST_CASE("file_store rejects keys that could escape its directory", "[storage][file_store]")
{
  const temp_directory dir;
  file_store store(dir.path);

  CHECK_FALSE(file_store::is_valid_key(""));
  CHECK_FALSE(file_store::is_valid_key("../secrets"));
  CHECK_FALSE(file_store::is_valid_key("a/b"));
  CHECK_FALSE(file_store::is_valid_key(".hidden"));
  CHECK(file_store::is_valid_key("vine_sync.follow_sets"));

  CHECK_FALSE(store.put("../escape", "x"));
  CHECK_FALSE(store.get("../escape").has_value());
}
