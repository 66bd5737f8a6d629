#pragma once

#include <array>
#include <flightledger/schema/enum_string.hpp>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

// Schema type: hash algorithm.
// Integrity workflow: versioned hash function identifier embedded in every
// checkpoint and mission digest so verifiers can reject foreign material.
namespace flightledger::schema {

enum class hash_algorithm : uint16_t {
  blake3_256 = 1,
  sha256 = 2,
};

inline constexpr auto kDefaultHashAlgorithm = hash_algorithm::blake3_256;

inline constexpr auto kHashAlgorithmMappings = std::array{
    std::pair<std::string_view, hash_algorithm>{"blake3-256",
                                                hash_algorithm::blake3_256},
    std::pair<std::string_view, hash_algorithm>{"sha256",
                                                hash_algorithm::sha256},
};

inline constexpr std::optional<hash_algorithm> try_hash_algorithm_from_string(
    const std::string_view value) {
  return from_string(value, kHashAlgorithmMappings);
}

inline constexpr std::optional<hash_algorithm> try_hash_algorithm_from_id(
    const uint16_t id) {
  return from_id(id, kHashAlgorithmMappings);
}

inline constexpr std::string_view to_string(const hash_algorithm value) {
  return to_string(value, kHashAlgorithmMappings).value_or("unknown");
}

}  // namespace flightledger::schema
