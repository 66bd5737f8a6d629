#pragma once

#include <flightledger/schema/canonical_entry.hpp>
#include <flightledger/schema/hash_algorithm.hpp>
#include <flightledger/schema/primitives.hpp>
#include <cstdint>

namespace flightledger::chain {

/// Hash arbitrary bytes with the selected algorithm.
flightledger::schema::hash32_t hash_bytes(
    flightledger::schema::hash_algorithm algorithm,
    const flightledger::schema::bytes_view_t& bytes);

flightledger::schema::hash32_t hash_entry(
    flightledger::schema::hash_algorithm algorithm,
    const flightledger::schema::canonical_entry_t& canonical);

/// Predecessor chain hash of index 0: 32 zero bytes for every algorithm.
flightledger::schema::hash32_t genesis_chain_hash();

/// H(entry_hash || prev_chain_hash || SCALE u64 index).
flightledger::schema::hash32_t link_hash(
    flightledger::schema::hash_algorithm algorithm,
    const flightledger::schema::hash32_t& entry_hash,
    const flightledger::schema::hash32_t& prev_chain_hash,
    uint64_t index);

}  // namespace flightledger::chain
