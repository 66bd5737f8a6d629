#include <flightledger/schema/encoding/scale/checkpoint.hpp>
#include <flightledger/schema/encoding/scale/encoder.hpp>

#include <spdlog/spdlog.h>

#include <exception>
#include <tuple>

using namespace flightledger::schema;

namespace flightledger::schema::encoding::scale {

namespace {

using wire_t = std::
    tuple<uint16_t, uint64_t, hash32_t, timestamp_milliseconds_t, uint16_t>;

wire_t to_wire(const checkpoint<1>& o) {
  return wire_t{o.version, o.index, o.chain_hash, o.timestamp,
                static_cast<uint16_t>(o.algorithm)};
}

std::optional<checkpoint<1>> from_wire(const wire_t& wire) {
  const auto& [version, index, chain_hash, timestamp, algorithm_id] = wire;
  if (version != 1) {
    return std::nullopt;
  }
  auto algorithm = try_hash_algorithm_from_id(algorithm_id);
  if (!algorithm.has_value()) {
    return std::nullopt;
  }
  return checkpoint<1>{.version = version,
                       .index = index,
                       .chain_hash = chain_hash,
                       .timestamp = timestamp,
                       .algorithm = *algorithm};
}

template <typename T>
std::optional<T> try_decode_wire(const bytes_view_t& bytes) {
  try {
    auto encoder = scale_encoder_t{};
    return encoder.try_decode<T>(bytes);
  } catch (const std::exception& ex) {
    spdlog::debug("Checkpoint bytes rejected by SCALE decoder: {}", ex.what());
    return std::nullopt;
  }
}

}  // namespace

bytes_t encode(const checkpoint<1>& o) {
  auto encoder = scale_encoder_t{};
  return encoder.encode(to_wire(o));
}

bytes_t encode(const std::vector<checkpoint<1>>& o) {
  auto wire = std::vector<wire_t>{};
  wire.reserve(o.size());
  for (const auto& cp : o) {
    wire.push_back(to_wire(cp));
  }
  auto encoder = scale_encoder_t{};
  return encoder.encode(wire);
}

std::optional<checkpoint<1>> try_decode_checkpoint(const bytes_view_t& bytes) {
  auto decoded = try_decode_wire<wire_t>(bytes);
  if (!decoded.has_value()) {
    return std::nullopt;
  }
  return from_wire(*decoded);
}

std::optional<std::vector<checkpoint<1>>> try_decode_checkpoint_history(
    const bytes_view_t& bytes) {
  auto decoded = try_decode_wire<std::vector<wire_t>>(bytes);
  if (!decoded.has_value()) {
    return std::nullopt;
  }
  auto history = std::vector<checkpoint<1>>{};
  history.reserve(decoded->size());
  for (const auto& wire : *decoded) {
    auto cp = from_wire(wire);
    if (!cp.has_value()) {
      return std::nullopt;
    }
    history.push_back(*cp);
  }
  return history;
}

}  // namespace flightledger::schema::encoding::scale
