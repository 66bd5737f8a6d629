#pragma once
#include <flightledger/schema/mission_digest.hpp>
#include <optional>

namespace flightledger::schema::encoding::scale {

flightledger::schema::bytes_t encode(const mission_digest<1>& o);

/// std::nullopt on truncated bytes, unknown version or unknown algorithm.
std::optional<mission_digest<1>> try_decode_mission_digest(
    const flightledger::schema::bytes_view_t& bytes);

}  // namespace flightledger::schema::encoding::scale
