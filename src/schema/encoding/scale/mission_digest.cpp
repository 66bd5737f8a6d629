#include <flightledger/schema/encoding/scale/encoder.hpp>
#include <flightledger/schema/encoding/scale/mission_digest.hpp>

#include <spdlog/spdlog.h>

#include <exception>
#include <string>
#include <tuple>

using namespace flightledger::schema;

namespace flightledger::schema::encoding::scale {

namespace {

using wire_t = std::tuple<uint16_t,
                          std::string,
                          uint16_t,
                          hash32_t,
                          uint64_t,
                          timestamp_milliseconds_t,
                          hash32_t>;

}  // namespace

bytes_t encode(const mission_digest<1>& o) {
  auto encoder = scale_encoder_t{};
  return encoder.encode(wire_t{o.version, o.mission_id,
                               static_cast<uint16_t>(o.algorithm),
                               o.final_chain_hash, o.entry_count, o.created_at,
                               o.digest});
}

std::optional<mission_digest<1>> try_decode_mission_digest(
    const bytes_view_t& bytes) {
  auto decoded = std::optional<wire_t>{};
  try {
    auto encoder = scale_encoder_t{};
    decoded = encoder.try_decode<wire_t>(bytes);
  } catch (const std::exception& ex) {
    spdlog::debug("Mission digest bytes rejected by SCALE decoder: {}",
                  ex.what());
    return std::nullopt;
  }
  if (!decoded.has_value()) {
    return std::nullopt;
  }

  auto& [version, mission_id, algorithm_id, final_chain_hash, entry_count,
         created_at, digest] = *decoded;
  if (version != 1) {
    return std::nullopt;
  }
  auto algorithm = try_hash_algorithm_from_id(algorithm_id);
  if (!algorithm.has_value()) {
    return std::nullopt;
  }
  return mission_digest<1>{.version = version,
                           .mission_id = std::move(mission_id),
                           .algorithm = *algorithm,
                           .final_chain_hash = final_chain_hash,
                           .entry_count = entry_count,
                           .created_at = created_at,
                           .digest = digest};
}

}  // namespace flightledger::schema::encoding::scale
