#pragma once

#include <flightledger/schema/chain_link.hpp>
#include <flightledger/schema/hash_algorithm.hpp>
#include <flightledger/schema/mission_digest.hpp>
#include <cstdint>
#include <optional>

namespace flightledger::chain {

/// Reduce a chain tip and mission metadata into an anchorable digest.
///
/// `entry_count` must be `final_link->index + 1`, or 0 when there is no link
/// (the digest then commits to the genesis chain hash); otherwise
/// `common::sequence_error`. Deterministic: `created_at` is taken from the
/// caller, never from a clock.
flightledger::schema::mission_digest_t finalize(
    flightledger::schema::hash_algorithm algorithm,
    flightledger::schema::mission_id_t mission_id,
    const std::optional<flightledger::schema::chain_link_t>& final_link,
    uint64_t entry_count,
    flightledger::schema::timestamp_milliseconds_t created_at);

/// Commitment over every field of `digest` except `digest.digest` itself.
flightledger::schema::hash32_t compute_commitment(
    const flightledger::schema::mission_digest_t& digest);

}  // namespace flightledger::chain
