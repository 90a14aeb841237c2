#include <core/id_generator.hpp>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <fmt/format.h>

namespace vine_sync::core {

auto id_generator::random_hex() -> std::string
{
  static thread_local boost::uuids::random_generator gen;
  const auto uuid = gen();

  std::string hex;
  hex.reserve(uuid.size() * 2);
  for (const auto byte : uuid) { hex += fmt::format("{:02x}", static_cast<unsigned>(byte)); }
  return hex;
}

auto id_generator::subscription_id(std::string_view name) -> std::string
{
  return fmt::format("{}_{}", name, random_hex());
}

}// namespace vine_sync::core
